#include <gtest/gtest.h>
#include <pokewire/field_codec.hpp>
#include <pokewire/error.hpp>
#include <string>

using namespace pokewire;

namespace {

struct Record {
    uint8_t flags = 0;
    int16_t level = 0;
    uint32_t id = 0;
    int64_t balance = 0;
    std::string name;
    Bytes blob;

    bool operator==(const Record& other) const {
        return flags == other.flags && level == other.level && id == other.id &&
               balance == other.balance && name == other.name && blob == other.blob;
    }
};

const FieldTable<Record>& RecordFields() {
    static const FieldTable<Record> table = FieldTable<Record>()
        .Integer("flags", &Record::flags)
        .Integer("level", &Record::level)
        .Integer("id", &Record::id)
        .Integer("balance", &Record::balance)
        .Prefixed<uint8_t>("name", &Record::name)
        .Prefixed<int32_t>("blob", &Record::blob);
    return table;
}

struct Payload {
    Bytes data;
};

const FieldTable<Payload>& PayloadFields() {
    static const FieldTable<Payload> table = FieldTable<Payload>()
        .Prefixed<int32_t>("data", &Payload::data);
    return table;
}

struct ShortPayload {
    Bytes data;
};

const FieldTable<ShortPayload>& ShortPayloadFields() {
    static const FieldTable<ShortPayload> table = FieldTable<ShortPayload>()
        .Prefixed<int16_t>("data", &ShortPayload::data);
    return table;
}

struct UnsignedPayload {
    Bytes data;
};

const FieldTable<UnsignedPayload>& UnsignedPayloadFields() {
    static const FieldTable<UnsignedPayload> table = FieldTable<UnsignedPayload>()
        .Prefixed<uint64_t>("data", &UnsignedPayload::data);
    return table;
}

Record SampleRecord() {
    Record record;
    record.flags = 0xA5;
    record.level = -300;
    record.id = 0xDEADBEEF;
    record.balance = -1234567890123LL;
    record.name = "Bulbasaur";
    record.blob = {0x01, 0x02, 0x03, 0xFF};
    return record;
}

} // namespace

class FieldCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        record_ = SampleRecord();
        encoded_ = RecordFields().Serialize(record_);
    }

    Record record_;
    Bytes encoded_;
};

TEST_F(FieldCodecTest, LayoutIsLittleEndianInDeclarationOrder) {
    ASSERT_EQ(encoded_.size(), 1u + 2 + 4 + 8 + (1 + 9) + (4 + 4));

    EXPECT_EQ(encoded_[0], 0xA5);

    // -300 as i16 LE
    EXPECT_EQ(encoded_[1], 0xD4);
    EXPECT_EQ(encoded_[2], 0xFE);

    EXPECT_EQ(encoded_[3], 0xEF);
    EXPECT_EQ(encoded_[4], 0xBE);
    EXPECT_EQ(encoded_[5], 0xAD);
    EXPECT_EQ(encoded_[6], 0xDE);

    // name: u8 length then bytes
    EXPECT_EQ(encoded_[15], 9);
    EXPECT_EQ(std::string(encoded_.begin() + 16, encoded_.begin() + 25), "Bulbasaur");

    // blob: i32 length then bytes
    EXPECT_EQ(encoded_[25], 4);
    EXPECT_EQ(encoded_[26], 0);
    EXPECT_EQ(encoded_[27], 0);
    EXPECT_EQ(encoded_[28], 0);
    EXPECT_EQ(encoded_[32], 0xFF);
}

TEST_F(FieldCodecTest, DeserializeRestoresValue) {
    size_t consumed = 0;
    Record decoded = RecordFields().Deserialize(encoded_.data(), encoded_.size(), consumed);
    EXPECT_EQ(decoded, record_);
    EXPECT_EQ(consumed, encoded_.size());
}

TEST_F(FieldCodecTest, EmptyVariableFields) {
    Record record;
    Bytes encoded = RecordFields().Serialize(record);
    EXPECT_EQ(encoded.size(), 1u + 2 + 4 + 8 + 1 + 4);
    EXPECT_EQ(RecordFields().Deserialize(encoded), record);
}

TEST_F(FieldCodecTest, EveryShortPrefixIsTruncated) {
    for (size_t length = 0; length < encoded_.size(); ++length) {
        size_t consumed = 0;
        try {
            RecordFields().Deserialize(encoded_.data(), length, consumed);
            FAIL() << "prefix of " << length << " bytes decoded";
        } catch (const ProtocolError& e) {
            EXPECT_EQ(e.GetKind(), ErrorKind::Truncated) << "prefix of " << length << " bytes";
            EXPECT_FALSE(e.GetField().empty());
        }
    }
}

TEST_F(FieldCodecTest, TruncationNamesTheField) {
    // Cut inside the "id" field
    size_t consumed = 0;
    try {
        RecordFields().Deserialize(encoded_.data(), 5, consumed);
        FAIL() << "expected truncation";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.GetKind(), ErrorKind::Truncated);
        EXPECT_EQ(e.GetField(), "id");
    }

    // Cut inside the bytes of "blob"
    try {
        RecordFields().Deserialize(encoded_.data(), encoded_.size() - 1, consumed);
        FAIL() << "expected truncation";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.GetKind(), ErrorKind::Truncated);
        EXPECT_EQ(e.GetField(), "blob");
    }
}

TEST_F(FieldCodecTest, TrailingBytesAreReportedNotConsumed) {
    Bytes padded = encoded_;
    padded.push_back(0x99);
    padded.push_back(0x98);

    size_t consumed = 0;
    Record decoded = RecordFields().Deserialize(padded.data(), padded.size(), consumed);
    EXPECT_EQ(decoded, record_);
    EXPECT_EQ(consumed, encoded_.size());
}

TEST_F(FieldCodecTest, EncodedSizeMatchesSerialize) {
    EXPECT_EQ(RecordFields().EncodedSize(record_), encoded_.size());
}

TEST_F(FieldCodecTest, Descriptors) {
    auto descriptors = RecordFields().Descriptors();
    ASSERT_EQ(descriptors.size(), 6u);

    EXPECT_EQ(descriptors[0].name, "flags");
    EXPECT_EQ(descriptors[0].kind, WireKind::UInt8);
    EXPECT_FALSE(descriptors[0].prefix.has_value());

    EXPECT_EQ(descriptors[1].kind, WireKind::Int16);
    EXPECT_EQ(descriptors[2].kind, WireKind::UInt32);
    EXPECT_EQ(descriptors[3].kind, WireKind::Int64);

    EXPECT_EQ(descriptors[4].name, "name");
    EXPECT_EQ(descriptors[4].kind, WireKind::Blob);
    ASSERT_TRUE(descriptors[4].prefix.has_value());
    EXPECT_EQ(*descriptors[4].prefix, WireKind::UInt8);

    EXPECT_EQ(descriptors[5].name, "blob");
    EXPECT_EQ(*descriptors[5].prefix, WireKind::Int32);
}

TEST(FieldCodecLimitsTest, MaximumFieldSizeIsAccepted) {
    const int32_t length = static_cast<int32_t>(protocol::MAX_FIELD_SIZE);

    ByteWriter writer;
    writer.WriteInt<int32_t>(length);
    Bytes body(protocol::MAX_FIELD_SIZE, 0x5A);
    writer.WriteBytes(body.data(), body.size());

    Payload decoded = PayloadFields().Deserialize(writer.GetBuffer());
    EXPECT_EQ(decoded.data.size(), protocol::MAX_FIELD_SIZE);
    EXPECT_EQ(decoded.data.back(), 0x5A);
}

TEST(FieldCodecLimitsTest, OneByteOverMaximumIsRejected) {
    ByteWriter writer;
    writer.WriteInt<int32_t>(static_cast<int32_t>(protocol::MAX_FIELD_SIZE + 1));

    try {
        PayloadFields().Deserialize(writer.GetBuffer());
        FAIL() << "expected SizeLimitExceeded";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.GetKind(), ErrorKind::SizeLimitExceeded);
        EXPECT_EQ(e.GetField(), "data");
    }
}

TEST(FieldCodecLimitsTest, UnsignedPrefixAboveMaximumIsRejected) {
    ByteWriter writer;
    writer.WriteInt<uint64_t>(0xFFFFFFFFFFFFFFFFull);

    try {
        UnsignedPayloadFields().Deserialize(writer.GetBuffer());
        FAIL() << "expected SizeLimitExceeded";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.GetKind(), ErrorKind::SizeLimitExceeded);
    }
}

TEST(FieldCodecLimitsTest, NegativeLengthIsRejected) {
    ByteWriter writer;
    writer.WriteInt<int32_t>(-1);
    writer.WriteUInt8(0x00);

    try {
        PayloadFields().Deserialize(writer.GetBuffer());
        FAIL() << "expected InvalidLength";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.GetKind(), ErrorKind::InvalidLength);
        EXPECT_EQ(e.GetField(), "data");
    }
}

TEST(FieldCodecLimitsTest, LengthOverflowOnEncode) {
    ShortPayload fits;
    fits.data.assign(32767, 0x01);
    EXPECT_EQ(ShortPayloadFields().Serialize(fits).size(), 2u + 32767);

    ShortPayload too_long;
    too_long.data.assign(32768, 0x01);
    try {
        ShortPayloadFields().Serialize(too_long);
        FAIL() << "expected LengthOverflow";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.GetKind(), ErrorKind::LengthOverflow);
        EXPECT_EQ(e.GetField(), "data");
    }
}

TEST(FieldCodecLimitsTest, ByteLengthStringOverflow) {
    Record record;
    record.name.assign(256, 'x');
    EXPECT_THROW(RecordFields().Serialize(record), ProtocolError);

    record.name.assign(255, 'x');
    EXPECT_NO_THROW(RecordFields().Serialize(record));
}

TEST(ByteReaderTest, ReadsAndTracksOffset) {
    Bytes data = {0x01, 0x34, 0x12, 0xAA, 0xBB};
    ByteReader reader(data);

    EXPECT_EQ(reader.ReadUInt8("a"), 0x01);
    EXPECT_EQ(reader.ReadUInt16LE("b"), 0x1234);
    EXPECT_EQ(reader.GetOffset(), 3u);
    EXPECT_EQ(reader.GetRemaining(), 2u);

    Bytes rest = reader.ReadRemaining();
    EXPECT_EQ(rest, (Bytes{0xAA, 0xBB}));
    EXPECT_EQ(reader.GetRemaining(), 0u);

    EXPECT_THROW(reader.ReadUInt8("c"), ProtocolError);
}

TEST(WireKindTest, WidthsAndNames) {
    EXPECT_EQ(WireKindWidth(WireKind::Int8), 1u);
    EXPECT_EQ(WireKindWidth(WireKind::UInt16), 2u);
    EXPECT_EQ(WireKindWidth(WireKind::Int32), 4u);
    EXPECT_EQ(WireKindWidth(WireKind::UInt64), 8u);
    EXPECT_EQ(WireKindWidth(WireKind::Blob), 0u);

    EXPECT_STREQ(WireKindName(WireKind::Int16), "i16");
    EXPECT_STREQ(WireKindName(WireKind::UInt8), "u8");
    EXPECT_STREQ(WireKindName(WireKind::Blob), "blob");

    static_assert(WireKindOf<int8_t>() == WireKind::Int8);
    static_assert(WireKindOf<uint64_t>() == WireKind::UInt64);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
