#include <ocast/Messenger/Cryptor.hpp>
#include <QDebug>

namespace ocast {

Cryptor::~Cryptor()
{
    deinit();
}

bool Cryptor::init()
{
    deinit();

    m_ctx = SSL_CTX_new(TLS_client_method());
    if (!m_ctx) {
        qWarning() << "[Cryptor] SSL_CTX_new failed:" << ERR_get_error();
        return false;
    }

    // Receivers present self-signed certificates
    SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, nullptr);

    m_ssl = SSL_new(m_ctx);
    if (!m_ssl) {
        qWarning() << "[Cryptor] SSL_new failed:" << ERR_get_error();
        deinit();
        return false;
    }

    m_readBio = BIO_new(BIO_s_mem());
    m_writeBio = BIO_new(BIO_s_mem());
    BIO_set_mem_eof_return(m_readBio, -1);
    BIO_set_mem_eof_return(m_writeBio, -1);
    BIO_set_write_buf_size(m_readBio, BIO_BUFFER_SIZE);
    BIO_set_write_buf_size(m_writeBio, BIO_BUFFER_SIZE);

    // SSL takes ownership of BIOs
    SSL_set_bio(m_ssl, m_readBio, m_writeBio);
    SSL_set_connect_state(m_ssl);

    m_active = false;
    m_failed = false;
    return true;
}

void Cryptor::deinit()
{
    if (m_ssl) {
        SSL_free(m_ssl); // also frees the BIOs
        m_ssl = nullptr;
        m_readBio = nullptr;
        m_writeBio = nullptr;
    }
    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
    m_active = false;
}

bool Cryptor::doHandshake()
{
    if (m_active) return true;
    if (!m_ssl) return false;

    int ret = SSL_do_handshake(m_ssl);
    if (ret == 1) {
        m_active = true;
        return true;
    }

    int err = SSL_get_error(m_ssl, ret);
    if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
        qWarning() << "[Cryptor] handshake failed, ssl error" << err;
        m_failed = true;
    }
    return false;
}

bool Cryptor::hasFailed() const
{
    return m_failed;
}

QByteArray Cryptor::readHandshakeBuffer()
{
    return drainWriteBio();
}

void Cryptor::writeHandshakeBuffer(const QByteArray& data)
{
    if (!m_readBio) return;
    BIO_write(m_readBio, data.constData(), data.size());
}

QByteArray Cryptor::encrypt(const QByteArray& plaintext)
{
    if (!m_active) return {};

    int written = SSL_write(m_ssl, plaintext.constData(), plaintext.size());
    if (written <= 0) {
        qWarning() << "[Cryptor] SSL_write failed, ssl error" << SSL_get_error(m_ssl, written);
        return {};
    }
    return drainWriteBio();
}

QByteArray Cryptor::decrypt(const QByteArray& ciphertext)
{
    if (!m_active) return {};

    BIO_write(m_readBio, ciphertext.constData(), ciphertext.size());

    // Drain every complete record; a partial one stays in the BIO
    QByteArray result;
    char chunk[2048];
    while (true) {
        int read = SSL_read(m_ssl, chunk, sizeof(chunk));
        if (read <= 0) break;
        result.append(chunk, read);
    }
    return result;
}

bool Cryptor::isActive() const
{
    return m_active;
}

QByteArray Cryptor::drainWriteBio()
{
    if (!m_writeBio) return {};

    int pending = BIO_ctrl_pending(m_writeBio);
    if (pending <= 0) return {};

    QByteArray result(pending, Qt::Uninitialized);
    int read = BIO_read(m_writeBio, result.data(), pending);
    if (read <= 0) return {};

    result.resize(read);
    return result;
}

} // namespace ocast
