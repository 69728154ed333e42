/**
 * @file listcommand.h
 * @brief LIST and NLST: directory listings over the data connection.
 */

#ifndef LISTCOMMAND_H
#define LISTCOMMAND_H

#include "transfercommand.h"
#include "models/listargument.h"
#include "services/filelistformatter.h"

/**
 * @brief LIST: sends a long-format listing of a directory or file.
 *
 * The argument is parsed only after the data connection is open, so a
 * malformed argument is answered with 501 after 150.
 */
class ListCommand : public TransferCommand
{
public:
    [[nodiscard]] QString name() const override { return QStringLiteral("LIST"); }

    TransferOutcome transfer(FtpSession &session, IDataConnection &connection,
                             TransferContext &context) override;

protected:
    /**
     * @brief Picks the line format for a parsed argument.
     */
    [[nodiscard]] virtual const IFileFormatter &formatterFor(const ListArgument &argument) const;
};

/**
 * @brief NLST: sends bare names, or LIST lines with the 'l' option.
 */
class NlstCommand : public ListCommand
{
public:
    [[nodiscard]] QString name() const override { return QStringLiteral("NLST"); }

protected:
    [[nodiscard]] const IFileFormatter &formatterFor(const ListArgument &argument) const override;
};

#endif // LISTCOMMAND_H
