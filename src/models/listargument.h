/**
 * @file listargument.h
 * @brief Parsed form of a LIST or NLST argument.
 */

#ifndef LISTARGUMENT_H
#define LISTARGUMENT_H

#include <QString>

#include <optional>

/**
 * @brief Path, wildcard pattern and option characters of a listing request.
 *
 * A plain value recomputed for every command; two arguments parsed from the
 * same text compare equal.
 */
struct ListArgument
{
    QString path = QStringLiteral("./");
    QString pattern;  ///< Wildcard for the last segment, empty for "all"
    QString options;  ///< Option characters in the order given, e.g. "al"

    [[nodiscard]] bool hasOption(QChar option) const { return options.contains(option); }
    [[nodiscard]] bool hasPattern() const { return !pattern.isEmpty(); }

    bool operator==(const ListArgument &other) const
    {
        return path == other.path && pattern == other.pattern && options == other.options;
    }
    bool operator!=(const ListArgument &other) const { return !(*this == other); }
};

/**
 * @brief Splits a raw listing argument into options, path and pattern.
 *
 * Tokens starting with '-' before the path contribute option characters;
 * the first other token starts the path, which then extends to the end of
 * the argument so names containing spaces survive. Unknown option
 * characters are kept and ignored by the lister.
 *
 * @par Examples:
 * @code
 * ListArgumentParser::parse("");           // path "./"
 * ListArgumentParser::parse("-la docs");   // options "la", path "docs"
 * ListArgumentParser::parse("src/m*.cpp"); // path "src/", pattern "m*.cpp"
 * ListArgumentParser::parse("s*c/x");      // std::nullopt
 * @endcode
 */
class ListArgumentParser
{
public:
    /**
     * @brief Parses a raw argument.
     * @param argument The text after the command verb, may be empty.
     * @param errorString Receives a diagnostic on failure, may be null.
     * @return The parsed argument, or std::nullopt if a directory segment
     *         contains a wildcard.
     */
    [[nodiscard]] static std::optional<ListArgument> parse(const QString &argument,
                                                           QString *errorString = nullptr);

    /**
     * @brief Checks whether text contains any of the wildcard characters '*', '?' or '['.
     */
    [[nodiscard]] static bool containsWildcard(const QString &text);
};

#endif // LISTARGUMENT_H
