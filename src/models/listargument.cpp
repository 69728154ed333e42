#include "listargument.h"

std::optional<ListArgument> ListArgumentParser::parse(const QString &argument, QString *errorString)
{
    ListArgument result;

    const QString trimmed = argument.trimmed();
    QString path;
    int pos = 0;
    while (pos < trimmed.length()) {
        if (trimmed.at(pos) == ' ') {
            ++pos;
            continue;
        }

        int end = trimmed.indexOf(' ', pos);
        if (end < 0) {
            end = trimmed.length();
        }

        if (trimmed.at(pos) != '-') {
            // Path runs to the end, spaces included
            path = trimmed.mid(pos);
            break;
        }

        result.options += trimmed.mid(pos + 1, end - pos - 1);
        pos = end;
    }

    if (!path.isEmpty()) {
        result.path = path;
    }

    const int slash = result.path.lastIndexOf('/');
    if (slash < 0) {
        if (containsWildcard(result.path)) {
            result.pattern = result.path;
            result.path = QStringLiteral("./");
        }
    } else if (slash != result.path.length() - 1) {
        const QString lastSegment = result.path.mid(slash + 1);
        if (containsWildcard(lastSegment)) {
            result.pattern = lastSegment;
            result.path = result.path.left(slash + 1);
        }
    }

    if (containsWildcard(result.path)) {
        if (errorString) {
            *errorString = QStringLiteral("Directory path can not contain wildcards: %1").arg(result.path);
        }
        return std::nullopt;
    }

    if (result.pattern == QLatin1String("*")) {
        result.pattern.clear();
    }

    return result;
}

bool ListArgumentParser::containsWildcard(const QString &text)
{
    return text.contains('*') || text.contains('?') || text.contains('[');
}
