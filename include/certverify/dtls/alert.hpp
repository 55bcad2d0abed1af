/// @file
/// @brief Declaration of the Alert protocol message class.

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace certverify::dtls
{

/// @brief Alert protocol message class.
class Alert final
{
public:
    /// @brief Alert message description.
    enum Description
    {
        CloseNotify = 0,
        UnexpectedMessage = 10,
        BadRecordMac = 20,
        RecordOverflow = 22,
        HandshakeFailure = 40,
        BadCertificate = 42,
        UnsupportedCertificate = 43,
        CertificateRevoked = 44,
        CertificateExpired = 45,
        CertificateUnknown = 46,
        IllegalParameter = 47,
        UnknownCA = 48,
        AccessDenied = 49,
        DecodeError = 50,
        DecryptError = 51,
        ProtocolVersion = 70,
        InsufficientSecurity = 71,
        InternalError = 80,
        UserCanceled = 90,
        NoRenegotiation = 100,
        UnsupportedExtension = 110,
        None = 256, // Pseudo-value for tracking correctness.
    };

    /// @brief Default constructor.
    Alert();

    /// @brief Destructor.
    ~Alert() noexcept;

    /// @brief Copy constructor.
    /// @param other Constant reference to the alert message.
    Alert(const Alert& other);

    /// @brief Move constructor.
    /// @param other rvalue reference to the alert message.
    Alert(Alert&& other) noexcept;

    /// @brief Copy assignment operator.
    /// @param other Constant reference to the alert message.
    /// @return Reference to the alert message.
    Alert& operator=(const Alert& other);

    /// @brief Move assignment operator.
    /// @param other rvalue reference to the alert message.
    /// @return Reference to the alert message.
    Alert& operator=(Alert&& other) noexcept;

    /// @brief Constructor that forms an alert message from a specific description and fatal flag.
    /// @param description Alert message description.
    /// @param fatal Alert message fatal flag.
    /// @param peer Identifier of the peer the alert is sent to.
    Alert(Description description, bool fatal = false, std::string peer = {});

    /// @brief Method to check if the alert message is fatal.
    /// @retval true - if the Alert message is fatal.
    /// @retval false - otherwise.
    bool isFatal() const noexcept;

    /// @brief Method to check if the alert message is valid.
    /// @retval true - if the alert description was set.
    /// @retval false - otherwise.
    bool isValid() const noexcept;

    /// @brief Method to get the alert description.
    /// @return Alert description.
    Description description() const noexcept;

    /// @brief Gets the peer the alert is addressed to.
    const std::string& peer() const noexcept;

    /// @brief Method to convert to a string representation.
    /// @return String representation.
    std::string toString() const;

    /// @brief Method to serialize the alert message into a byte array.
    /// @return Byte array.
    std::vector<uint8_t> serialize() const;

private:
    bool fatal_;
    Description description_;
    std::string peer_;
};

} // namespace certverify::dtls
