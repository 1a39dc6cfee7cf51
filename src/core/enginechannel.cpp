module;
#include <QFuture>
#include <QPromise>

module tondar.core.enginechannel;

namespace tondar {

QFuture<CommandResult> readyCommandResult(const CommandResult& result)
{
    QPromise<CommandResult> promise;
    QFuture<CommandResult> future = promise.future();
    promise.start();
    promise.addResult(result);
    promise.finish();
    return future;
}

} // namespace tondar

EngineChannel::EngineChannel(QObject* parent) : QObject(parent) {}

EngineChannel::~EngineChannel() = default;
