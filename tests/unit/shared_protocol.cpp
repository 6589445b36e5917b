#include <array>
#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lanxfer/codec.hpp"
#include "lanxfer/crypto.hpp"
#include "lanxfer/encoding/base64.hpp"
#include "lanxfer/error_codes.hpp"
#include "lanxfer/protocol.hpp"

using namespace lanxfer;
using namespace lanxfer::protocol;

void run_engine_component_tests();

namespace
{

    std::vector<Packet> sample_packets()
    {
        const FileEntry entry{
            .name = "résumé \"final\" {v2}.txt",
            .relative_path = "docs/日本語/résumé \"final\" {v2}.txt",
            .size = 153600,
            .is_directory = false,
        };

        std::vector<Packet> packets;
        packets.push_back(make_packet(PacketType::Request, "recv-1",
                                      RequestData{
                                          .pairing_code = "482913",
                                          .device_id = "0123456789abcdef0123456789abcdef",
                                          .device_name = "Zoë's laptop",
                                          .save_path = "/home/zoë/Downloads",
                                      }));
        packets.push_back(make_packet(PacketType::Handshake, "recv-1",
                                      HandshakeData{
                                          .sender_session_id = "send-1",
                                          .files = {FileEntry{.name = "docs", .relative_path = "docs", .size = 0, .is_directory = true},
                                                    entry},
                                          .total_size = 153600,
                                      }));
        packets.push_back(make_packet(PacketType::FileInfo, "recv-1", entry));
        packets.push_back(make_packet(PacketType::FileData, "recv-1", FileChunk{.chunk = "3q2+7w=="}));
        packets.push_back(make_packet(PacketType::FileEnd, "recv-1", FileEnd{.name = entry.name}));
        packets.push_back(make_packet(PacketType::Ack, "recv-1", Ack{.ready = true, .file_complete = std::nullopt}));
        packets.push_back(make_packet(PacketType::Ack, "recv-1", Ack{.ready = std::nullopt, .file_complete = true}));
        packets.push_back(make_packet(PacketType::Error, "recv-1", ErrorMessage{.message = "bad {\"json\"}"}));
        packets.push_back(make_packet(PacketType::Cancel, "recv-1"));
        return packets;
    }

    std::vector<std::uint8_t> concat_frames(const std::vector<Packet> &packets)
    {
        std::vector<std::uint8_t> stream;
        for (const auto &packet : packets)
        {
            const auto frame = encode_packet(packet);
            stream.insert(stream.end(), frame.begin(), frame.end());
        }
        return stream;
    }

    std::vector<std::uint8_t> raw_frame(const std::string &payload)
    {
        std::vector<std::uint8_t> frame(kFrameHeaderSize + payload.size());
        const auto size = static_cast<std::uint32_t>(payload.size());
        frame[0] = static_cast<std::uint8_t>(size >> 24);
        frame[1] = static_cast<std::uint8_t>(size >> 16);
        frame[2] = static_cast<std::uint8_t>(size >> 8);
        frame[3] = static_cast<std::uint8_t>(size);
        std::memcpy(frame.data() + kFrameHeaderSize, payload.data(), payload.size());
        return frame;
    }

    void test_packet_envelope()
    {
        const auto packet = make_packet(PacketType::FileData, "abc", FileChunk{.chunk = "AAEC"});
        const auto json = nlohmann::json(packet);
        assert(json.at("type") == "file-data");
        assert(json.at("sessionId") == "abc");
        assert(json.at("data").at("chunk") == "AAEC");

        const auto entry_json = nlohmann::json(FileEntry{.name = "a", .relative_path = "d/a", .size = 3, .is_directory = false});
        assert(entry_json.contains("relativePath"));
        assert(entry_json.contains("isDirectory"));

        const auto ack_json = nlohmann::json(Ack{.ready = true, .file_complete = std::nullopt});
        assert(ack_json.contains("ready"));
        assert(!ack_json.contains("fileComplete"));
    }

    void test_codec_idempotence()
    {
        for (const auto &packet : sample_packets())
        {
            const auto frame = encode_packet(packet);
            const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
            assert(decoded.has_value());
            assert(decoded->bytes_consumed == frame.size());
            assert(decode_packet(decoded->payload) == packet);
        }

        const auto handshake = decode_packet(
            try_decode_frame(encode_packet(sample_packets()[1]))->payload);
        const auto data = handshake.data.get<HandshakeData>();
        assert(data.files.size() == 2);
        assert(data.files[1].relative_path == "docs/日本語/résumé \"final\" {v2}.txt");
        assert(data.total_size == 153600);
    }

    void test_length_prefix_counts_bytes()
    {
        const auto packet = make_packet(PacketType::FileEnd, "s", FileEnd{.name = "ü"});
        const auto frame = encode_packet(packet);
        const std::uint32_t declared = (static_cast<std::uint32_t>(frame[0]) << 24) |
                                       (static_cast<std::uint32_t>(frame[1]) << 16) |
                                       (static_cast<std::uint32_t>(frame[2]) << 8) | frame[3];
        assert(declared == frame.size() - kFrameHeaderSize);
    }

    void test_partial_reads()
    {
        const auto packets = sample_packets();
        const auto stream = concat_frames(packets);

        FrameDecoder whole;
        const auto at_once = whole.feed(stream);
        assert(at_once.size() == packets.size());
        assert(whole.buffered() == 0);

        FrameDecoder bytewise;
        std::vector<std::string> one_by_one;
        for (const auto byte : stream)
        {
            auto out = bytewise.feed(std::span<const std::uint8_t>(&byte, 1));
            one_by_one.insert(one_by_one.end(), out.begin(), out.end());
        }
        assert(one_by_one == at_once);
        for (std::size_t i = 0; i < packets.size(); ++i)
        {
            assert(decode_packet(one_by_one[i]) == packets[i]);
        }
    }

    void test_split_header()
    {
        const auto frame = encode_packet(make_packet(PacketType::Cancel, "x"));
        FrameDecoder decoder;

        assert(decoder.feed(std::span<const std::uint8_t>(frame.data(), 2)).empty());
        assert(!decoder.expected_length().has_value());
        assert(decoder.buffered() == 2);

        assert(decoder.feed(std::span<const std::uint8_t>(frame.data() + 2, 3)).empty());
        assert(decoder.expected_length().has_value());

        const auto out = decoder.feed(std::span<const std::uint8_t>(frame.data() + 5, frame.size() - 5));
        assert(out.size() == 1);
        assert(decode_packet(out.front()).type == PacketType::Cancel);
        assert(decoder.buffered() == 0);

        // Two frames and the start of a third in one read.
        auto stream = concat_frames({make_packet(PacketType::Cancel, "a"), make_packet(PacketType::Cancel, "b")});
        stream.insert(stream.end(), frame.begin(), frame.begin() + 3);
        FrameDecoder batched;
        assert(batched.feed(stream).size() == 2);
        assert(batched.buffered() == 3);
    }

    void test_size_cap()
    {
        const auto frame = encode_packet(make_packet(PacketType::Error, "x", ErrorMessage{.message = std::string(256, 'e')}));

        FrameDecoder capped(64);
        bool rejected = false;
        try
        {
            capped.feed(frame);
        }
        catch (const TransferError &ex)
        {
            rejected = ex.code() == ErrorCode::PacketTooLarge;
        }
        assert(rejected);

        FrameDecoder roomy(4096);
        assert(roomy.feed(frame).size() == 1);

        rejected = false;
        try
        {
            (void)try_decode_frame(frame, 16);
        }
        catch (const TransferError &ex)
        {
            rejected = ex.code() == ErrorCode::PacketTooLarge;
        }
        assert(rejected);
    }

    void test_malformed_and_unknown()
    {
        const auto expect_code = [](const std::string &payload, ErrorCode expected)
        {
            try
            {
                (void)decode_packet(payload);
            }
            catch (const TransferError &ex)
            {
                return ex.code() == expected;
            }
            return false;
        };

        assert(expect_code("{not json", ErrorCode::InvalidPacket));
        assert(expect_code("[1,2,3]", ErrorCode::InvalidPacket));
        assert(expect_code(R"({"sessionId":"a","data":{}})", ErrorCode::InvalidPacket));
        assert(expect_code(R"({"type":"ack","data":{}})", ErrorCode::InvalidPacket));
        assert(expect_code(R"({"type":"ack","sessionId":"a","data":[1]})", ErrorCode::InvalidPacket));
        assert(expect_code(R"({"type":"teleport","sessionId":"a","data":{}})", ErrorCode::UnknownPacket));

        const auto without_data = decode_packet(R"({"type":"cancel","sessionId":"a"})");
        assert(without_data.type == PacketType::Cancel);
        assert(without_data.data.is_object());

        // A bad payload does not disturb the frames around it.
        auto stream = concat_frames({make_packet(PacketType::Cancel, "before")});
        const auto garbage = raw_frame("{\"type\":");
        stream.insert(stream.end(), garbage.begin(), garbage.end());
        const auto after = encode_packet(make_packet(PacketType::Cancel, "after"));
        stream.insert(stream.end(), after.begin(), after.end());

        FrameDecoder decoder;
        const auto payloads = decoder.feed(stream);
        assert(payloads.size() == 3);
        assert(decode_packet(payloads[0]).session_id == "before");
        assert(expect_code(payloads[1], ErrorCode::InvalidPacket));
        assert(decode_packet(payloads[2]).session_id == "after");
    }

    void test_invalid_utf8_is_replaced()
    {
        const auto packet = make_packet(PacketType::FileEnd, "s", FileEnd{.name = std::string("bad\xFF" "name")});
        const auto frame = encode_packet(packet);
        const auto decoded = decode_packet(try_decode_frame(frame)->payload);
        const auto name = decoded.data.at("name").get<std::string>();
        assert(name.rfind("bad", 0) == 0);
        assert(name.find("name") != std::string::npos);
    }

    void test_base64()
    {
        const std::string text = "Many hands make light work.";
        const auto bytes = std::as_bytes(std::span<const char>(text.data(), text.size()));
        const auto encoded = encoding::encode_base64(bytes);
        assert(encoded == "TWFueSBoYW5kcyBtYWtlIGxpZ2h0IHdvcmsu");

        assert(encoding::encode_base64({}).empty());
        const std::array<std::byte, 1> one{std::byte{0xFF}};
        assert(encoding::encode_base64(one) == "/w==");
        const std::array<std::byte, 2> two{std::byte{0xFF}, std::byte{0x00}};
        assert(encoding::encode_base64(two) == "/wA=");

        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded.has_value());
        assert(std::string(reinterpret_cast<const char *>(decoded->data()), decoded->size()) == text);

        const auto padded = encoding::decode_base64("/wA=");
        assert(padded.has_value() && padded->size() == 2);
        assert((*padded)[0] == std::byte{0xFF});

        assert(encoding::decode_base64("").has_value());
        assert(!encoding::decode_base64("ab$d").has_value());
        assert(!encoding::decode_base64("/w==AAAA").has_value());
    }

    void test_crypto()
    {
        const auto uuid = crypto::random_uuid();
        assert(uuid.size() == 36);
        assert(uuid[8] == '-' && uuid[13] == '-' && uuid[18] == '-' && uuid[23] == '-');
        assert(uuid[14] == '4');
        assert(crypto::random_uuid() != uuid);

        for (int i = 0; i < 200; ++i)
        {
            const auto code = crypto::random_pairing_code();
            assert(code.size() == 6);
            assert(code.find_first_not_of("0123456789") == std::string::npos);
            assert(code[0] != '0');
        }

        assert(crypto::sha256_hex("abc") ==
               "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        // Unkeyed BLAKE2b-256 of the empty input.
        assert(crypto::Blake2bHasher().final_hex() ==
               "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        crypto::Blake2bHasher whole;
        const auto chunk_hash = whole.update(chunk).final_hex();

        crypto::Blake2bHasher split;
        split.update(std::span(chunk).first(1)).update(std::span(chunk).subspan(1));
        assert(split.final_hex() == chunk_hash);

        bool threw = false;
        try
        {
            whole.update(chunk);
        }
        catch (const std::logic_error &)
        {
            threw = true;
        }
        assert(threw);

        const auto file_path = std::filesystem::temp_directory_path() / "lanxfer_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        assert(crypto::hash_file(file_path) == chunk_hash);
        std::filesystem::remove(file_path);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::PathRejected) == "path_rejected");
        assert(error_code_from_int(to_int(ErrorCode::PeerError)) == ErrorCode::PeerError);
        const TransferError error(ErrorCode::NotFound, "missing");
        assert(error.code() == ErrorCode::NotFound);
        assert(std::string(error.what()) == "missing");
    }

} // namespace

int main()
{
    try
    {
        test_packet_envelope();
        test_codec_idempotence();
        test_length_prefix_counts_bytes();
        test_partial_reads();
        test_split_header();
        test_size_cap();
        test_malformed_and_unknown();
        test_invalid_utf8_is_replaced();
        test_base64();
        test_crypto();
        test_error_codes();
        run_engine_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
