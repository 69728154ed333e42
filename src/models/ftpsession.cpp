#include "ftpsession.h"

FtpSession::FtpSession(const QString &identity,
                       std::unique_ptr<IFileSystemView> view,
                       IDataTransport &transport,
                       IReplyChannel &replies,
                       const EngineSettings &settings)
    : identity_(identity)
    , view_(std::move(view))
    , replies_(replies)
    , dataConnection_(transport)
    , uniqueNames_(settings.uniqueDefaultFileName, settings.uniqueMaxAttempts)
{
}

void FtpSession::resetTransientState()
{
    restartOffset_ = 0;
    renameFrom_.reset();
}
