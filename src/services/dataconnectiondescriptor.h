/**
 * @file dataconnectiondescriptor.h
 * @brief Negotiated but not yet opened data channel of a session.
 */

#ifndef DATACONNECTIONDESCRIPTOR_H
#define DATACONNECTIONDESCRIPTOR_H

#include <QHostAddress>
#include <QString>

#include <memory>
#include <optional>

class PassiveListener;

/**
 * @brief Result of a PORT or PASV command.
 *
 * Active descriptors carry the client's address to connect back to. Passive
 * descriptors share ownership of the listening socket; dropping the last copy
 * stops listening. Whether a transfer may proceed is decided by the capability
 * query hasPeerAddress(), not by the concrete mode.
 *
 * @par Example usage:
 * @code
 * auto descriptor = DataConnectionDescriptor::fromHostPort("192,168,1,64,4,0");
 * if (descriptor) {
 *     session.setDataDescriptor(*descriptor);  // replaces any earlier one
 * }
 * @endcode
 */
class DataConnectionDescriptor
{
public:
    /**
     * @brief How the data connection is established.
     */
    enum class Mode {
        None,     ///< Nothing negotiated
        Active,   ///< Server connects to the client (PORT)
        Passive   ///< Client connects to the server (PASV)
    };

    /// Multiplier for the high byte in the h1,h2,h3,h4,p1,p2 form
    static constexpr int PortMultiplier = 256;

    DataConnectionDescriptor() = default;

    /**
     * @brief Creates an active-mode descriptor.
     * @param address Client address to connect to.
     * @param port Client port.
     * @param secure True if the data channel must be TLS protected.
     */
    [[nodiscard]] static DataConnectionDescriptor active(const QHostAddress &address, quint16 port,
                                                         bool secure = false);

    /**
     * @brief Creates a passive-mode descriptor.
     * @param listener Listening socket clients will connect to.
     * @param advertisedAddress Address announced to the client; the listener's
     *        address when null.
     * @param secure True if the data channel must be TLS protected.
     */
    [[nodiscard]] static DataConnectionDescriptor passive(std::shared_ptr<PassiveListener> listener,
                                                          const QHostAddress &advertisedAddress = QHostAddress(),
                                                          bool secure = false);

    /**
     * @brief Parses the RFC 959 host-port form of a PORT argument.
     * @param text "h1,h2,h3,h4,p1,p2".
     * @param secure True if the data channel must be TLS protected.
     * @return An active descriptor, or nullopt if the text is malformed.
     */
    [[nodiscard]] static std::optional<DataConnectionDescriptor> fromHostPort(const QString &text,
                                                                             bool secure = false);

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] QHostAddress address() const { return address_; }
    [[nodiscard]] quint16 port() const { return port_; }
    [[nodiscard]] bool isSecure() const { return secure_; }
    [[nodiscard]] PassiveListener *listener() const { return listener_.get(); }

    /**
     * @brief Checks whether a concrete endpoint is known.
     * @return True for an active descriptor with a client address or a passive
     *         descriptor whose listener is still listening.
     */
    [[nodiscard]] bool hasPeerAddress() const;

    /**
     * @brief Renders the endpoint in the h1,h2,h3,h4,p1,p2 form used by the 227 reply.
     * @return Empty if the address is not IPv4.
     */
    [[nodiscard]] QString toHostPortString() const;

private:
    Mode mode_ = Mode::None;
    QHostAddress address_;
    quint16 port_ = 0;
    bool secure_ = false;
    std::shared_ptr<PassiveListener> listener_;
};

#endif // DATACONNECTIONDESCRIPTOR_H
