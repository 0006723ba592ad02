#pragma once

#include <ocast/Version.hpp>

#include <QByteArray>

#include <openssl/ssl.h>
#include <openssl/bio.h>
#include <openssl/err.h>

namespace ocast {

/// TLS client over a pair of memory BIOs. The socket never touches OpenSSL;
/// ciphertext is moved in and out by the Messenger.
class Cryptor {
public:
    Cryptor() = default;
    ~Cryptor();

    Cryptor(const Cryptor&) = delete;
    Cryptor& operator=(const Cryptor&) = delete;

    bool init();
    void deinit();

    bool doHandshake();
    bool hasFailed() const;
    QByteArray readHandshakeBuffer();
    void writeHandshakeBuffer(const QByteArray& data);

    QByteArray encrypt(const QByteArray& plaintext);
    QByteArray decrypt(const QByteArray& ciphertext);

    bool isActive() const;

private:
    QByteArray drainWriteBio();

    SSL_CTX* m_ctx = nullptr;
    SSL* m_ssl = nullptr;
    BIO* m_readBio = nullptr;  // incoming ciphertext, SSL reads from it
    BIO* m_writeBio = nullptr; // outgoing ciphertext, SSL writes to it
    bool m_active = false;
    bool m_failed = false;
};

} // namespace ocast
