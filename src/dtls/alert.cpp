#include <certverify/dtls/alert.hpp>

namespace certverify::dtls
{

namespace
{

const char* DescriptionToString(const Alert::Description description)
{
    switch (description)
    {
    case Alert::Description::CloseNotify:
        return "close_notify";
    case Alert::Description::UnexpectedMessage:
        return "unexpected_message";
    case Alert::Description::BadRecordMac:
        return "bad_record_mac";
    case Alert::Description::RecordOverflow:
        return "record_overflow";
    case Alert::Description::HandshakeFailure:
        return "handshake_failure";
    case Alert::Description::BadCertificate:
        return "bad_certificate";
    case Alert::Description::UnsupportedCertificate:
        return "unsupported_certificate";
    case Alert::Description::CertificateRevoked:
        return "certificate_revoked";
    case Alert::Description::CertificateExpired:
        return "certificate_expired";
    case Alert::Description::CertificateUnknown:
        return "certificate_unknown";
    case Alert::Description::IllegalParameter:
        return "illegal_parameter";
    case Alert::Description::UnknownCA:
        return "unknown_ca";
    case Alert::Description::AccessDenied:
        return "access_denied";
    case Alert::Description::DecodeError:
        return "decode_error";
    case Alert::Description::DecryptError:
        return "decrypt_error";
    case Alert::Description::ProtocolVersion:
        return "protocol_version";
    case Alert::Description::InsufficientSecurity:
        return "insufficient_security";
    case Alert::Description::InternalError:
        return "internal_error";
    case Alert::Description::UserCanceled:
        return "user_canceled";
    case Alert::Description::NoRenegotiation:
        return "no_renegotiation";
    case Alert::Description::UnsupportedExtension:
        return "unsupported_extension";
    case Alert::Description::None:
        return "none";
    }

    return nullptr;
}

} // namespace

Alert::Alert()
    : fatal_(false)
    , description_(Description::None)
{
}

Alert::~Alert() noexcept = default;

Alert::Alert(const Alert& other) = default;

Alert::Alert(Alert&& other) noexcept = default;

Alert& Alert::operator=(const Alert& other) = default;

Alert& Alert::operator=(Alert&& other) noexcept = default;

Alert::Alert(Description description, bool fatal, std::string peer)
    : fatal_(fatal)
    , description_(description)
    , peer_(std::move(peer))
{
}

bool Alert::isFatal() const noexcept
{
    return fatal_;
}

bool Alert::isValid() const noexcept
{
    return (description_ != Alert::Description::None);
}

Alert::Description Alert::description() const noexcept
{
    return description_;
}

const std::string& Alert::peer() const noexcept
{
    return peer_;
}

std::string Alert::toString() const
{
    const char* knownAlert = DescriptionToString(description());
    if (knownAlert)
    {
        return std::string(knownAlert);
    }

    return "unknown_alert_" + std::to_string(static_cast<size_t>(description()));
}

std::vector<uint8_t> Alert::serialize() const
{
    if (isValid())
    {
        std::vector<uint8_t> message(2);
        message[0] = isFatal() ? 2 : 1;
        message[1] = static_cast<uint8_t>(description());
        return message;
    }
    return std::vector<uint8_t>();
}

} // namespace certverify::dtls
