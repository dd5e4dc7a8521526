#pragma once

#include <optional>

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace phicore::samsungtv::ipc {

// SmartView2 pairing key material (all fields hex in the key file).
struct HjKeyMaterial {
    QByteArray publicKey;
    QByteArray privateKey;
    QByteArray prime;
    QByteArray wbKey;
    QByteArray transKey;

    static std::optional<HjKeyMaterial> fromJson(const QJsonObject &obj, QString *error = nullptr);
    static std::optional<HjKeyMaterial> loadFromFile(const QString &path, QString *error = nullptr);
};

struct HjServerHello {
    QByteArray message;
    QByteArray hash;
    QByteArray aesKey;
};

struct HjClientHello {
    QByteArray skPrime;
    // AES-128 key for the socket.io command channel.
    QByteArray sessionKey;
};

class HjPairingCrypto
{
public:
    explicit HjPairingCrypto(HjKeyMaterial keys);

    bool generateServerHello(const QString &userId, const QString &pin, HjServerHello *out, QString *error = nullptr) const;
    bool parseClientHello(const QByteArray &clientHello,
                          const HjServerHello &hello,
                          const QString &userId,
                          HjClientHello *out,
                          QString *error = nullptr) const;

    static QString serverAcknowledge(const QByteArray &skPrime);
    static bool verifyClientAcknowledge(const QString &clientAck, const QByteArray &skPrime);

private:
    QByteArray whiteBoxEncrypt(const QByteArray &data, QString *error) const;
    QByteArray whiteBoxDecrypt(const QByteArray &data, QString *error) const;

    HjKeyMaterial m_keys;
};

QByteArray sha1(const QByteArray &data);
// AES-128-ECB with PKCS#7 padding, as used for HJ key events.
QByteArray hjEncryptCommand(const QByteArray &sessionKey, const QByteArray &plain, QString *error = nullptr);
QByteArray hjDecryptCommand(const QByteArray &sessionKey, const QByteArray &cipher, QString *error = nullptr);
// "[b0,b1,...]" with unsigned decimal bytes.
QString formatByteList(const QByteArray &data);

} // namespace phicore::samsungtv::ipc
