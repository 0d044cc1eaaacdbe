#include <gtest/gtest.h>
#include "ScpiScope.h"

using BlockStatus = ScpiScope::BlockStatus;

TEST(ScpiScopeTest, VisaSocketAddress) {
    QString host;
    quint16 port = 0;
    ASSERT_TRUE(ScpiScope::parseAddress("TCPIP0::192.168.1.50::4000::SOCKET", host, port));
    EXPECT_EQ(host, "192.168.1.50");
    EXPECT_EQ(port, 4000);
    ASSERT_TRUE(ScpiScope::parseAddress("tcpip0::scope.lab::5025::socket", host, port));
    EXPECT_EQ(host, "scope.lab");
    EXPECT_EQ(port, 5025);
}

TEST(ScpiScopeTest, HostPortAndBareHost) {
    QString host;
    quint16 port = 0;
    ASSERT_TRUE(ScpiScope::parseAddress("10.0.0.7:4001", host, port));
    EXPECT_EQ(host, "10.0.0.7");
    EXPECT_EQ(port, 4001);
    ASSERT_TRUE(ScpiScope::parseAddress("  scope  ", host, port));
    EXPECT_EQ(host, "scope");
    EXPECT_EQ(port, ScpiScope::DEFAULT_PORT);
}

TEST(ScpiScopeTest, RejectsBadAddresses) {
    QString host;
    quint16 port = 0;
    EXPECT_FALSE(ScpiScope::parseAddress("", host, port));
    EXPECT_FALSE(ScpiScope::parseAddress("TCPIP0::10.0.0.1::4000::INSTR", host, port));
    EXPECT_FALSE(ScpiScope::parseAddress("TCPIP0::10.0.0.1::99999::SOCKET", host, port));
    EXPECT_FALSE(ScpiScope::parseAddress("host:notaport", host, port));
    EXPECT_FALSE(ScpiScope::parseAddress(":4000", host, port));
}

TEST(ScpiScopeTest, CompleteBlock) {
    QByteArray payload;
    int consumed = 0;
    const QByteArray buffer = QByteArray("#15") + QByteArray("\x01\x02\x03\x04\x05", 5) + "\n";
    ASSERT_EQ(ScpiScope::parseDefiniteLengthBlock(buffer, payload, consumed), BlockStatus::Complete);
    EXPECT_EQ(payload, QByteArray("\x01\x02\x03\x04\x05", 5));
    EXPECT_EQ(consumed, 8);
}

TEST(ScpiScopeTest, BlockArrivingInPieces) {
    QByteArray payload;
    int consumed = 0;
    EXPECT_EQ(ScpiScope::parseDefiniteLengthBlock("#", payload, consumed), BlockStatus::Incomplete);
    EXPECT_EQ(ScpiScope::parseDefiniteLengthBlock("#42", payload, consumed), BlockStatus::Incomplete);
    EXPECT_EQ(ScpiScope::parseDefiniteLengthBlock("#42500abc", payload, consumed), BlockStatus::Incomplete);

    QByteArray full("#42500");
    full.append(QByteArray(2500, '\x80'));
    ASSERT_EQ(ScpiScope::parseDefiniteLengthBlock(full, payload, consumed), BlockStatus::Complete);
    EXPECT_EQ(payload.size(), 2500);
    EXPECT_EQ(consumed, 6 + 2500);
}

TEST(ScpiScopeTest, MalformedBlockHeaders) {
    QByteArray payload;
    int consumed = 0;
    EXPECT_EQ(ScpiScope::parseDefiniteLengthBlock("1.5\n", payload, consumed), BlockStatus::Malformed);
    EXPECT_EQ(ScpiScope::parseDefiniteLengthBlock("#0abc", payload, consumed), BlockStatus::Malformed);
    EXPECT_EQ(ScpiScope::parseDefiniteLengthBlock("#2x1", payload, consumed), BlockStatus::Malformed);
}

TEST(ScpiScopeTest, DecodeSingleByteCodes) {
    const QByteArray payload("\x00\x7f\x80\xff", 4);
    QVector<int> codes;
    ASSERT_TRUE(ScpiScope::decodeCodes(payload, 1, "RPB", codes));
    EXPECT_EQ(codes, QVector<int>({0, 127, 128, 255}));
    ASSERT_TRUE(ScpiScope::decodeCodes(payload, 1, "RIB", codes));
    EXPECT_EQ(codes, QVector<int>({0, 127, -128, -1}));
}

TEST(ScpiScopeTest, DecodeTwoByteBigEndian) {
    const QByteArray payload("\x01\x00\xff\xfe", 4);
    QVector<int> codes;
    ASSERT_TRUE(ScpiScope::decodeCodes(payload, 2, "RPB", codes));
    EXPECT_EQ(codes, QVector<int>({256, 65534}));
    ASSERT_TRUE(ScpiScope::decodeCodes(payload, 2, "RIB", codes));
    EXPECT_EQ(codes, QVector<int>({256, -2}));
    EXPECT_FALSE(ScpiScope::decodeCodes(QByteArray("\x01", 1), 2, "RPB", codes));
    EXPECT_FALSE(ScpiScope::decodeCodes(payload, 3, "RPB", codes));
}

TEST(ScpiScopeTest, UnreachableAddressFailsToOpen) {
    ScpiScope scope;
    EXPECT_FALSE(scope.open("TCPIP0::host::4000::INSTR", 100));
    EXPECT_FALSE(scope.isConnected());
    EXPECT_TRUE(scope.errorString().contains("Unsupported"));
}

TEST(ScpiScopeTest, HighBitBytesKeepTheirValue) {
    QByteArray payload;
    for (int b = 0; b < 256; ++b) payload.append(char(b));
    QVector<int> codes;
    ASSERT_TRUE(ScpiScope::decodeCodes(payload, 1, "RPB", codes));
    ASSERT_EQ(codes.size(), 256);
    for (int b = 0; b < 256; ++b) EXPECT_EQ(codes[b], b);
    ASSERT_TRUE(ScpiScope::decodeCodes(payload, 1, "RIB", codes));
    for (int b = 0; b < 256; ++b) EXPECT_EQ(codes[b], b < 128 ? b : b - 256);

    const QByteArray wide("\x80\x00\x7f\xff\x00\x80", 6);
    ASSERT_TRUE(ScpiScope::decodeCodes(wide, 2, "RPB", codes));
    EXPECT_EQ(codes, QVector<int>({32768, 32767, 128}));
    ASSERT_TRUE(ScpiScope::decodeCodes(wide, 2, "RIB", codes));
    EXPECT_EQ(codes, QVector<int>({-32768, 32767, 128}));
}
