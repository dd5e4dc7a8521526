#include "tv_hj_crypto.h"

#include <memory>

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStringList>
#include <QtEndian>

#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace phicore::samsungtv::ipc {

namespace {

constexpr int kBlockSize = 16;
constexpr int kGxSize = 0x80;
constexpr int kShaDigestLength = SHA_DIGEST_LENGTH;
constexpr int kUserIdLenPos = 11;
constexpr int kUserIdPos = 15;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
struct BnDeleter {
    void operator()(BIGNUM *bn) const { BN_free(bn); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX *ctx) const { BN_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

bool aes128(const EVP_CIPHER *cipher,
            const QByteArray &key,
            const QByteArray &input,
            bool encrypt,
            bool padding,
            QByteArray *output,
            QString *error)
{
    if (key.size() != kBlockSize) {
        if (error)
            *error = QStringLiteral("AES key must be 16 bytes");
        return false;
    }
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        if (error)
            *error = QStringLiteral("EVP_CIPHER_CTX_new failed");
        return false;
    }
    const unsigned char iv[kBlockSize] = {};
    const auto *keyData = reinterpret_cast<const unsigned char *>(key.constData());
    if (EVP_CipherInit_ex(ctx.get(), cipher, nullptr, keyData, iv, encrypt ? 1 : 0) != 1) {
        if (error)
            *error = QStringLiteral("EVP_CipherInit_ex failed");
        return false;
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), padding ? 1 : 0);

    QByteArray out(input.size() + kBlockSize, '\0');
    int written = 0;
    int finalLen = 0;
    auto *outData = reinterpret_cast<unsigned char *>(out.data());
    if (EVP_CipherUpdate(ctx.get(), outData, &written,
                         reinterpret_cast<const unsigned char *>(input.constData()), input.size()) != 1
        || EVP_CipherFinal_ex(ctx.get(), outData + written, &finalLen) != 1) {
        if (error)
            *error = QStringLiteral("AES operation failed");
        return false;
    }
    out.resize(written + finalLen);
    *output = out;
    return true;
}

QByteArray beUint32(quint32 value)
{
    QByteArray out(4, '\0');
    qToBigEndian(value, reinterpret_cast<uchar *>(out.data()));
    return out;
}

quint32 readBeUint32(const QByteArray &data, int pos)
{
    return qFromBigEndian<quint32>(reinterpret_cast<const uchar *>(data.constData() + pos));
}

bool readHexField(const QJsonObject &obj, const char *key, QByteArray *out, QString *error)
{
    const QString text = obj.value(QLatin1String(key)).toString().trimmed();
    const QByteArray bytes = QByteArray::fromHex(text.toLatin1());
    if (text.isEmpty() || bytes.isEmpty()) {
        if (error)
            *error = QStringLiteral("HJ key material is missing %1").arg(QLatin1String(key));
        return false;
    }
    *out = bytes;
    return true;
}

} // namespace

std::optional<HjKeyMaterial> HjKeyMaterial::fromJson(const QJsonObject &obj, QString *error)
{
    HjKeyMaterial keys;
    if (!readHexField(obj, "publicKey", &keys.publicKey, error)
        || !readHexField(obj, "privateKey", &keys.privateKey, error)
        || !readHexField(obj, "prime", &keys.prime, error)
        || !readHexField(obj, "wbKey", &keys.wbKey, error)
        || !readHexField(obj, "transKey", &keys.transKey, error))
        return std::nullopt;
    if (keys.publicKey.size() != kGxSize || keys.wbKey.size() != kBlockSize || keys.transKey.size() != kBlockSize) {
        if (error)
            *error = QStringLiteral("HJ key material has unexpected key sizes");
        return std::nullopt;
    }
    return keys;
}

std::optional<HjKeyMaterial> HjKeyMaterial::loadFromFile(const QString &path, QString *error)
{
    if (path.trimmed().isEmpty()) {
        if (error)
            *error = QStringLiteral("hjKeyFile is not configured");
        return std::nullopt;
    }
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return std::nullopt;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error)
            *error = QStringLiteral("Invalid JSON in %1: %2").arg(path, parseError.errorString());
        return std::nullopt;
    }
    return fromJson(doc.object(), error);
}

QByteArray sha1(const QByteArray &data)
{
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char *>(data.constData()), static_cast<size_t>(data.size()), digest);
    return QByteArray(reinterpret_cast<const char *>(digest), SHA_DIGEST_LENGTH);
}

HjPairingCrypto::HjPairingCrypto(HjKeyMaterial keys)
    : m_keys(std::move(keys))
{
}

QByteArray HjPairingCrypto::whiteBoxEncrypt(const QByteArray &data, QString *error) const
{
    QByteArray out;
    for (int pos = 0; pos + kBlockSize <= data.size(); pos += kBlockSize) {
        QByteArray block;
        if (!aes128(EVP_aes_128_cbc(), m_keys.wbKey, data.mid(pos, kBlockSize), true, false, &block, error))
            return {};
        out += block;
    }
    return out;
}

QByteArray HjPairingCrypto::whiteBoxDecrypt(const QByteArray &data, QString *error) const
{
    QByteArray out;
    for (int pos = 0; pos + kBlockSize <= data.size(); pos += kBlockSize) {
        QByteArray block;
        if (!aes128(EVP_aes_128_cbc(), m_keys.wbKey, data.mid(pos, kBlockSize), false, false, &block, error))
            return {};
        out += block;
    }
    return out;
}

bool HjPairingCrypto::generateServerHello(const QString &userId,
                                          const QString &pin,
                                          HjServerHello *out,
                                          QString *error) const
{
    const QByteArray aesKey = sha1(pin.toUtf8()).left(kBlockSize);
    QByteArray encrypted;
    if (!aes128(EVP_aes_128_cbc(), aesKey, m_keys.publicKey, true, false, &encrypted, error))
        return false;
    const QByteArray swapped = whiteBoxEncrypt(encrypted, error);
    if (swapped.size() != kGxSize)
        return false;

    const QByteArray user = userId.toUtf8();
    const QByteArray data = beUint32(static_cast<quint32>(user.size())) + user + swapped;

    QByteArray message;
    message.append('\x01');
    message.append('\x02');
    message.append(QByteArray(5, '\0'));
    message.append(beUint32(static_cast<quint32>(user.size() + 132)));
    message.append(data);
    message.append(QByteArray(5, '\0'));

    out->message = message;
    out->hash = sha1(data);
    out->aesKey = aesKey;
    return true;
}

bool HjPairingCrypto::parseClientHello(const QByteArray &clientHello,
                                       const HjServerHello &hello,
                                       const QString &userId,
                                       HjClientHello *out,
                                       QString *error) const
{
    auto fail = [error](const QString &message) {
        if (error)
            *error = message;
        return false;
    };

    if (clientHello.size() < kUserIdPos)
        return fail(QStringLiteral("Client hello too short"));
    const int userIdLen = static_cast<int>(readBeUint32(clientHello, kUserIdLenPos));
    const int gxPos = kUserIdPos + userIdLen;
    const int hashPos = gxPos + kGxSize;
    const int flagPos = hashPos + kShaDigestLength;
    if (userIdLen < 0 || clientHello.size() < flagPos + 5)
        return fail(QStringLiteral("Client hello too short"));

    const QByteArray clientUserId = clientHello.mid(kUserIdPos, userIdLen);
    const QByteArray encWbGx = clientHello.mid(gxPos, kGxSize);
    const QByteArray encGx = whiteBoxDecrypt(encWbGx, error);
    if (encGx.size() != kGxSize)
        return false;
    QByteArray gx;
    if (!aes128(EVP_aes_128_cbc(), hello.aesKey, encGx, false, false, &gx, error))
        return false;

    BnPtr bnGx(BN_bin2bn(reinterpret_cast<const unsigned char *>(gx.constData()), gx.size(), nullptr));
    BnPtr bnPrime(BN_bin2bn(reinterpret_cast<const unsigned char *>(m_keys.prime.constData()),
                            m_keys.prime.size(), nullptr));
    BnPtr bnPrivate(BN_bin2bn(reinterpret_cast<const unsigned char *>(m_keys.privateKey.constData()),
                              m_keys.privateKey.size(), nullptr));
    BnPtr bnSecret(BN_new());
    BnCtxPtr bnCtx(BN_CTX_new());
    if (!bnGx || !bnPrime || !bnPrivate || !bnSecret || !bnCtx
        || BN_mod_exp(bnSecret.get(), bnGx.get(), bnPrivate.get(), bnPrime.get(), bnCtx.get()) != 1)
        return fail(QStringLiteral("DH computation failed"));

    QByteArray secret(BN_num_bytes(bnSecret.get()), '\0');
    BN_bn2bin(bnSecret.get(), reinterpret_cast<unsigned char *>(secret.data()));

    const QByteArray expectedHash = clientHello.mid(hashPos, kShaDigestLength);
    if (sha1(clientUserId + secret) != expectedHash)
        return fail(QStringLiteral("Client hello hash mismatch (wrong PIN?)"));
    if (clientHello.at(flagPos) != '\0')
        return fail(QStringLiteral("Client hello first flag not null"));
    if (readBeUint32(clientHello, flagPos + 1) != 0)
        return fail(QStringLiteral("Client hello second flag not null"));

    const QByteArray finalBuffer = clientUserId + userId.toUtf8() + gx + m_keys.publicKey + secret;
    const QByteArray skPrime = sha1(finalBuffer);
    const QByteArray skPrimeHash = sha1(skPrime + QByteArray(1, '\x00'));

    QByteArray sessionKey;
    if (!aes128(EVP_aes_128_ecb(), m_keys.transKey, skPrimeHash.left(kBlockSize), true, false, &sessionKey, error))
        return false;

    out->skPrime = skPrime;
    out->sessionKey = sessionKey;
    return true;
}

QString HjPairingCrypto::serverAcknowledge(const QByteArray &skPrime)
{
    const QByteArray hash = sha1(skPrime + QByteArray(1, '\x01'));
    return QStringLiteral("0103000000000000000014%10000000000").arg(QString::fromLatin1(hash.toHex().toUpper()));
}

bool HjPairingCrypto::verifyClientAcknowledge(const QString &clientAck, const QByteArray &skPrime)
{
    const QByteArray hash = sha1(skPrime + QByteArray(1, '\x02'));
    const QString expected =
        QStringLiteral("0104000000000000000014%10000000000").arg(QString::fromLatin1(hash.toHex().toUpper()));
    return clientAck.trimmed().compare(expected, Qt::CaseInsensitive) == 0;
}

QByteArray hjEncryptCommand(const QByteArray &sessionKey, const QByteArray &plain, QString *error)
{
    QByteArray out;
    if (!aes128(EVP_aes_128_ecb(), sessionKey, plain, true, true, &out, error))
        return {};
    return out;
}

QByteArray hjDecryptCommand(const QByteArray &sessionKey, const QByteArray &cipher, QString *error)
{
    QByteArray out;
    if (!aes128(EVP_aes_128_ecb(), sessionKey, cipher, false, true, &out, error))
        return {};
    return out;
}

QString formatByteList(const QByteArray &data)
{
    QStringList parts;
    parts.reserve(data.size());
    for (char byte : data)
        parts.append(QString::number(static_cast<unsigned char>(byte)));
    return QStringLiteral("[%1]").arg(parts.join(QLatin1Char(',')));
}

} // namespace phicore::samsungtv::ipc
