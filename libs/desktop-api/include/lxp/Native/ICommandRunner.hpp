#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace lxp {

struct CommandResult {
    enum class Status {
        Finished,       // ran to completion, see exitCode
        FailedToStart,  // program missing or not executable
        Crashed
    };

    Status status = Status::Finished;
    int exitCode = 0;
    QByteArray standardError;
    QString errorString;

    bool succeeded() const { return status == Status::Finished && exitCode == 0; }
};

/// Runs an external program to completion. Backends that drive desktop
/// settings through helper tools (gsettings, xdg-open) go through this seam.
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    virtual CommandResult run(const QString& program, const QStringList& arguments) const = 0;
};

} // namespace lxp
