#ifndef IFTPSTATISTICS_H
#define IFTPSTATISTICS_H

#include <QtGlobal>

class FtpFile;
class FtpSession;

/**
 * @brief Receives transfer notifications from all sessions.
 *
 * Implementations are called concurrently from many session threads.
 */
class IFtpStatistics
{
public:
    virtual ~IFtpStatistics() = default;

    /**
     * @brief Records a completed upload.
     * @param session Session that uploaded.
     * @param file The stored resource.
     * @param bytes Bytes received.
     */
    virtual void recordUpload(const FtpSession &session, const FtpFile &file, qint64 bytes) = 0;
};

#endif // IFTPSTATISTICS_H
