#pragma once

#include <lxp/Native/ICommandRunner.hpp>

namespace lxp {

/// ICommandRunner backed by QProcess. Blocks the calling thread until the
/// program exits; no timeout is applied.
class ProcessCommandRunner : public ICommandRunner {
public:
    CommandResult run(const QString& program, const QStringList& arguments) const override;
};

} // namespace lxp
