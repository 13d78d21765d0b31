#ifndef POKEWIRE_MESSAGE_CODEC_HPP
#define POKEWIRE_MESSAGE_CODEC_HPP

#include "error.hpp"
#include "field_codec.hpp"
#include "messages.hpp"
#include "types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pokewire {

namespace internal {

template<typename T>
constexpr bool IsCatchAll = std::is_same_v<T, Unknown>;

// Outside the int8_t range, so it never collides with a real opcode
constexpr int CATCH_ALL_SLOT = 1000;

template<typename T>
constexpr int OpcodeOrCatchAll() {
    if constexpr (IsCatchAll<T>) {
        return CATCH_ALL_SLOT;
    } else {
        return T::OPCODE;
    }
}

template<typename... Ts>
constexpr bool OpcodesAreUnique() {
    constexpr std::array<int, sizeof...(Ts)> opcodes = {OpcodeOrCatchAll<Ts>()...};
    for (size_t i = 0; i < opcodes.size(); ++i) {
        if (opcodes[i] == CATCH_ALL_SLOT) {
            continue;
        }
        if (opcodes[i] == opcode::UNKNOWN) {
            return false;
        }
        for (size_t j = i + 1; j < opcodes.size(); ++j) {
            if (opcodes[i] == opcodes[j]) {
                return false;
            }
        }
    }
    return true;
}

} // namespace internal

/// Opcode-tagged union codec over a fixed set of message types
///
/// Every type except Unknown provides `static constexpr int8_t OPCODE` and
/// `static const FieldTable<T>& Fields()`. Including Unknown makes decoding
/// total: bytes with an unregistered opcode become an Unknown value instead of
/// an UnknownOpcode error.
///
/// Wire form: Opcode(1) + Body(...)
template<typename... Ts>
class MessageCodec {
public:
    using Message = std::variant<Ts...>;

    static constexpr size_t CATCH_ALL_COUNT = (static_cast<size_t>(internal::IsCatchAll<Ts>) + ... + 0);
    static constexpr bool HAS_CATCH_ALL = CATCH_ALL_COUNT > 0;

    static_assert(sizeof...(Ts) > 0, "codec needs at least one message type");
    static_assert(CATCH_ALL_COUNT <= 1, "at most one catch-all variant");
    static_assert(internal::OpcodesAreUnique<Ts...>(),
                  "opcodes must be unique and must not use the reserved catch-all opcode");

    /// Encode a message: opcode byte followed by its fields
    /// An Unknown value is written verbatim (its opcode, then its raw data)
    static Bytes Encode(const Message& message) {
        return std::visit([](const auto& value) { return EncodeOne(value); }, message);
    }

    /// Decode opcode + body
    /// @throws ProtocolError(EmptyMessage) for no input,
    ///         ProtocolError(UnknownOpcode) when no type matches and there is no catch-all,
    ///         and any field error of the matched type
    static Message Decode(const uint8_t* data, size_t size) {
        if (size == 0) {
            throw ProtocolError(ErrorKind::EmptyMessage, "No opcode found in message");
        }

        const uint8_t raw_opcode = data[0];
        const int8_t opcode = static_cast<int8_t>(raw_opcode);

        std::optional<Message> result;
        static_cast<void>((TryDecode<Ts>(opcode, data + 1, size - 1, result) || ...));
        if (result) {
            return std::move(*result);
        }

        if constexpr (HAS_CATCH_ALL) {
            Unknown unknown;
            unknown.opcode = opcode;
            unknown.data.assign(data + 1, data + size);
            return Message(std::move(unknown));
        } else {
            throw ProtocolError::UnknownOpcode(raw_opcode);
        }
    }

    static Message Decode(const Bytes& data) {
        return Decode(data.data(), data.size());
    }

    /// Get the opcode the message is written with
    static int8_t OpcodeOf(const Message& message) {
        return std::visit([](const auto& value) -> int8_t {
            using T = std::decay_t<decltype(value)>;
            if constexpr (internal::IsCatchAll<T>) {
                return value.opcode;
            } else {
                return T::OPCODE;
            }
        }, message);
    }

    /// Extract a concrete message from the union
    /// @throws ProtocolError(TypeMismatch) if the union holds another type
    template<typename T>
    static T Unwrap(Message message) {
        static_assert((std::is_same_v<T, Ts> || ...), "type is not part of this codec");
        if (T* value = std::get_if<T>(&message)) {
            return std::move(*value);
        }
        std::string expected = internal::IsCatchAll<T>
            ? std::string("catch-all")
            : "opcode " + std::to_string(internal::OpcodeOrCatchAll<T>());
        throw ProtocolError(ErrorKind::TypeMismatch,
                            "Expected " + expected + ", got opcode " + std::to_string(OpcodeOf(message)));
    }

private:
    template<typename T>
    static Bytes EncodeOne(const T& value) {
        ByteWriter writer;
        if constexpr (internal::IsCatchAll<T>) {
            writer.WriteUInt8(static_cast<uint8_t>(value.opcode));
            writer.WriteBytes(value.data.data(), value.data.size());
        } else {
            writer.WriteUInt8(static_cast<uint8_t>(T::OPCODE));
            T::Fields().Serialize(value, writer);
        }
        return writer.Take();
    }

    template<typename T>
    static bool TryDecode(int8_t opcode, const uint8_t* body, size_t size, std::optional<Message>& result) {
        if constexpr (internal::IsCatchAll<T>) {
            return false;
        } else {
            if (opcode != T::OPCODE) {
                return false;
            }
            ByteReader reader(body, size);
            result.emplace(std::in_place_type<T>, T::Fields().Deserialize(reader));
            return true;
        }
    }
};

/// The login exchange: ClientHello, ServerHello, ClientReady
using LoginCodec = MessageCodec<ClientHello, ServerHello, ClientReady>;

/// The login exchange with pass-through of unrecognized opcodes
using LoginCodecWithUnknown = MessageCodec<ClientHello, ServerHello, ClientReady, Unknown>;

} // namespace pokewire

#endif // POKEWIRE_MESSAGE_CODEC_HPP
