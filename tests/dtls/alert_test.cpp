#include <gtest/gtest.h>
#include <certverify/dtls/alert.hpp>

using namespace certverify::dtls;

TEST(AlertTest, DefaultConstructor) {
    Alert alert;
    ASSERT_FALSE(alert.isFatal());
    ASSERT_EQ(alert.description(), Alert::None);
    ASSERT_FALSE(alert.isValid());
    ASSERT_TRUE(alert.peer().empty());
}

TEST(AlertTest, ParameterizedConstructor) {
    Alert alert(Alert::HandshakeFailure, true, "10.0.0.1:5684");
    ASSERT_TRUE(alert.isFatal());
    ASSERT_EQ(alert.description(), Alert::HandshakeFailure);
    ASSERT_TRUE(alert.isValid());
    ASSERT_EQ(alert.peer(), "10.0.0.1:5684");
}

TEST(AlertTest, CopyConstructor) {
    Alert original(Alert::BadCertificate, false, "peer");
    Alert copy(original);
    ASSERT_EQ(copy.isFatal(), original.isFatal());
    ASSERT_EQ(copy.description(), original.description());
    ASSERT_EQ(copy.peer(), original.peer());
}

TEST(AlertTest, MoveConstructor) {
    Alert original(Alert::UnsupportedCertificate, true);
    Alert moved(std::move(original));
    ASSERT_TRUE(moved.isFatal());
    ASSERT_EQ(moved.description(), Alert::UnsupportedCertificate);
}

TEST(AlertTest, CopyAssignmentOperator) {
    Alert original(Alert::CertificateExpired, true);
    Alert copy;
    copy = original;
    ASSERT_EQ(copy.isFatal(), original.isFatal());
    ASSERT_EQ(copy.description(), original.description());
}

TEST(AlertTest, MoveAssignmentOperator) {
    Alert original(Alert::CertificateRevoked, false);
    Alert moved;
    moved = std::move(original);
    ASSERT_FALSE(moved.isFatal());
    ASSERT_EQ(moved.description(), Alert::CertificateRevoked);
}

TEST(AlertTest, ToStringAndSerialization) {
    Alert alert(Alert::HandshakeFailure, true);
    ASSERT_EQ(alert.toString(), "handshake_failure");

    std::vector<uint8_t> serialized = alert.serialize();
    ASSERT_EQ(serialized, std::vector<uint8_t>({2, 40}));

    ASSERT_TRUE(Alert().serialize().empty());
}
