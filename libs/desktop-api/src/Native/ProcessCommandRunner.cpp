#include <lxp/Native/ProcessCommandRunner.hpp>
#include <QProcess>
#include <QDebug>

namespace lxp {

CommandResult ProcessCommandRunner::run(const QString& program, const QStringList& arguments) const
{
    CommandResult result;

    QProcess process;
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.start(program, arguments);

    if (!process.waitForStarted()) {
        result.status = CommandResult::Status::FailedToStart;
        result.errorString = process.errorString();
        qDebug() << "[ProcessCommandRunner]" << program << "failed to start:" << result.errorString;
        return result;
    }

    process.closeWriteChannel();
    process.waitForFinished(-1);

    result.standardError = process.readAllStandardError();
    if (process.exitStatus() == QProcess::CrashExit) {
        result.status = CommandResult::Status::Crashed;
        result.errorString = process.errorString();
        return result;
    }

    result.exitCode = process.exitCode();
    return result;
}

} // namespace lxp
