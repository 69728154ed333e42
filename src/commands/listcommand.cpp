#include "listcommand.h"
#include "services/directorylister.h"
#include "utils/logging.h"

#include <QDebug>

namespace {

// Stateless, shared by all sessions
const ListFileFormatter listFormatter{};
const NlstFileFormatter nlstFormatter{};

} // namespace

TransferOutcome ListCommand::transfer(FtpSession &session, IDataConnection &connection,
                                      TransferContext &context)
{
    QString errorString;
    const std::optional<ListArgument> argument = ListArgumentParser::parse(context.argument,
                                                                           &errorString);
    if (!argument) {
        return TransferOutcome::syntaxError(errorString);
    }

    LOG_VERBOSE() << name() << "path:" << argument->path << "pattern:" << argument->pattern
                  << "options:" << argument->options;

    std::unique_ptr<QIODevice> listing = DirectoryLister::listFiles(*argument,
                                                                    session.fileSystemView(),
                                                                    formatterFor(*argument));
    return connection.transferToClient(*listing);
}

const IFileFormatter &ListCommand::formatterFor(const ListArgument &argument) const
{
    Q_UNUSED(argument)
    return listFormatter;
}

const IFileFormatter &NlstCommand::formatterFor(const ListArgument &argument) const
{
    if (argument.hasOption('l')) {
        return listFormatter;
    }
    return nlstFormatter;
}
