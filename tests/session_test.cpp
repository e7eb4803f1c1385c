#include <gtest/gtest.h>
#include "session.hpp"
#include "test_support.hpp"
#include <future>

using boost::asio::ip::tcp;
using protocol::MessageType;
using testing_support::Loopback;
using testing_support::TempDir;
using transfer::ErrorKind;
using transfer::MessageReceiver;
using transfer::MessageSender;
using transfer::ReceiverSession;
using transfer::SenderSession;
using transfer::TransferResult;

namespace {

// Accepts one connection and runs a receiver on it
std::future<TransferResult> receive_one(Loopback& loop, const std::filesystem::path& dir) {
    return std::async(std::launch::async, [&loop, dir]() {
        tcp::socket socket = loop.accept();
        ReceiverSession session(socket, dir);
        TransferResult result = session.run();
        EXPECT_EQ(session.state(), result.ok() ? ReceiverSession::State::DONE : ReceiverSession::State::ERROR);
        transfer::close_quietly(socket);
        return result;
    });
}

std::string expect_ack(tcp::socket& socket) {
    protocol::Message msg = MessageReceiver::receive(socket);
    EXPECT_EQ(msg.type, MessageType::ACK) << msg.text();
    return msg.text();
}

std::string expect_err(tcp::socket& socket) {
    protocol::Message msg = MessageReceiver::receive(socket);
    EXPECT_EQ(msg.type, MessageType::ERR) << msg.text();
    return msg.text();
}

void send_data(tcp::socket& socket, const std::string& bytes) {
    MessageSender::send(socket, MessageType::FDATA, bytes);
}

} // namespace

// ─── Sender and receiver together ───────────────────────────────────────────

class RoundTripTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(RoundTripTest, FileArrivesByteForByte) {
    TempDir tmp;
    std::filesystem::path source = tmp / "payload.bin";
    std::string content = testing_support::pattern_bytes(GetParam());
    testing_support::write_file(source, content);

    Loopback loop;
    auto receiver = receive_one(loop, tmp / "inbox");

    SenderSession sender(loop.io_context(), "127.0.0.1", loop.port(), source.string());
    TransferResult sent = sender.run();
    TransferResult received = receiver.get();

    ASSERT_TRUE(sent.ok()) << sent.detail;
    ASSERT_TRUE(received.ok()) << received.detail;
    EXPECT_EQ(sender.state(), SenderSession::State::DONE);
    EXPECT_EQ(sent.bytes_transferred, content.size());
    EXPECT_EQ(received.bytes_transferred, content.size());
    EXPECT_EQ(received.filename, "payload.bin");
    EXPECT_EQ(testing_support::read_file(received.path), content);
}

INSTANTIATE_TEST_SUITE_P(Sizes, RoundTripTest,
                         ::testing::Values(0, 10, protocol::kChunkSize, protocol::kChunkSize + 1,
                                           3 * 1024 * 1024 + 7));

TEST(SenderSessionTest, ReportsProgressAfterEveryAcknowledgedChunk) {
    TempDir tmp;
    std::filesystem::path source = tmp / "ten_k.dat";
    testing_support::write_file(source, testing_support::pattern_bytes(10000));

    Loopback loop;
    auto receiver = receive_one(loop, tmp / "inbox");

    std::vector<uint64_t> seen;
    std::vector<std::string> statuses;
    transfer::SessionCallbacks callbacks;
    callbacks.on_progress = [&seen](const std::string& name, uint64_t done, uint64_t total, double) {
        EXPECT_EQ(name, "ten_k.dat");
        EXPECT_EQ(total, 10000u);
        seen.push_back(done);
    };
    callbacks.on_status = [&statuses](const std::string& text) { statuses.push_back(text); };

    SenderSession sender(loop.io_context(), "127.0.0.1", loop.port(), source.string(), callbacks);
    TransferResult sent = sender.run();
    receiver.get();

    ASSERT_TRUE(sent.ok()) << sent.detail;
    EXPECT_EQ(seen, (std::vector<uint64_t>{4096, 8192, 10000}));
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[0], "Server ready: Ready to receive file");
    EXPECT_EQ(statuses[1], "File 'ten_k.dat' received successfully");
}

TEST(SenderSessionTest, SanitizesOutgoingName) {
    TempDir tmp;
    std::filesystem::path source = tmp / "my report (final).txt";
    testing_support::write_file(source, "abc");

    Loopback loop;
    auto receiver = receive_one(loop, tmp / "inbox");

    SenderSession sender(loop.io_context(), "127.0.0.1", loop.port(), source.string());
    TransferResult sent = sender.run();
    TransferResult received = receiver.get();

    ASSERT_TRUE(sent.ok()) << sent.detail;
    EXPECT_EQ(sent.filename, "myreportfinal.txt");
    EXPECT_EQ(std::filesystem::path(received.path).filename().string(), "myreportfinal.txt");
}

TEST(SenderSessionTest, UnicodeNameArrivesIntact) {
    TempDir tmp;
    const std::string name = "\xe6\x97\xa5\xe6\x9c\xac";
    testing_support::write_file(tmp / name, "kanji");

    Loopback loop;
    auto receiver = receive_one(loop, tmp / "inbox");

    SenderSession sender(loop.io_context(), "127.0.0.1", loop.port(), (tmp / name).string());
    TransferResult sent = sender.run();
    TransferResult received = receiver.get();

    ASSERT_TRUE(sent.ok()) << sent.detail;
    ASSERT_TRUE(received.ok()) << received.detail;
    EXPECT_EQ(sent.filename, name);
    EXPECT_EQ(received.filename, name);
    EXPECT_EQ(testing_support::read_file(tmp / "inbox" / name), "kanji");
}

// ─── Sender against a scripted peer ─────────────────────────────────────────

TEST(SenderSessionTest, ErrReplyIsRejection) {
    TempDir tmp;
    std::filesystem::path source = tmp / "a.txt";
    testing_support::write_file(source, "hello");

    Loopback loop;
    auto peer = std::async(std::launch::async, [&loop]() {
        tcp::socket socket = loop.accept();
        protocol::Message info = MessageReceiver::receive(socket);
        EXPECT_EQ(info.type, MessageType::FINFO);
        MessageSender::try_send_error(socket, "disk full");
        transfer::close_quietly(socket);
    });

    SenderSession sender(loop.io_context(), "127.0.0.1", loop.port(), source.string());
    TransferResult sent = sender.run();
    peer.get();

    EXPECT_FALSE(sent.ok());
    EXPECT_EQ(sent.error, ErrorKind::REJECTED);
    EXPECT_EQ(sent.detail, "Server error: disk full");
    EXPECT_EQ(sender.state(), SenderSession::State::ERROR);
}

TEST(SenderSessionTest, NonAckReplyIsRejection) {
    TempDir tmp;
    std::filesystem::path source = tmp / "a.txt";
    testing_support::write_file(source, "hello");

    Loopback loop;
    auto peer = std::async(std::launch::async, [&loop]() {
        tcp::socket socket = loop.accept();
        MessageReceiver::receive(socket);
        MessageSender::send(socket, MessageType::FEND, std::string());
        // Wait for the sender to hang up
        boost::system::error_code ec;
        char byte;
        boost::asio::read(socket, boost::asio::buffer(&byte, 1), ec);
    });

    SenderSession sender(loop.io_context(), "127.0.0.1", loop.port(), source.string());
    TransferResult sent = sender.run();
    peer.get();

    EXPECT_EQ(sent.error, ErrorKind::REJECTED);
    EXPECT_EQ(sent.detail, "Server replied FEND instead of ACK: ");
}

TEST(SenderSessionTest, PeerHangingUpIsConnectionClosed) {
    TempDir tmp;
    std::filesystem::path source = tmp / "a.txt";
    testing_support::write_file(source, testing_support::pattern_bytes(20000));

    Loopback loop;
    auto peer = std::async(std::launch::async, [&loop]() {
        tcp::socket socket = loop.accept();
        MessageReceiver::receive(socket);
        MessageSender::send_ack(socket, "Ready to receive file");
        MessageReceiver::receive(socket);
        transfer::close_quietly(socket);
    });

    SenderSession sender(loop.io_context(), "127.0.0.1", loop.port(), source.string());
    TransferResult sent = sender.run();
    peer.get();

    EXPECT_EQ(sent.error, ErrorKind::CONNECTION_CLOSED);
    EXPECT_EQ(sent.bytes_transferred, 0u);
}

TEST(SenderSessionTest, MissingFileFailsWithoutConnecting) {
    TempDir tmp;
    boost::asio::io_context io;

    SenderSession sender(io, "127.0.0.1", 1, (tmp / "nope.txt").string());
    TransferResult sent = sender.run();

    EXPECT_EQ(sent.error, ErrorKind::IO);
    EXPECT_EQ(sender.state(), SenderSession::State::ERROR);
}

TEST(SenderSessionTest, RefusedConnectionIsIoError) {
    TempDir tmp;
    std::filesystem::path source = tmp / "a.txt";
    testing_support::write_file(source, "x");

    unsigned short closed_port;
    {
        Loopback loop;
        closed_port = loop.port();
    }

    boost::asio::io_context io;
    SenderSession sender(io, "127.0.0.1", closed_port, source.string());
    TransferResult sent = sender.run();

    EXPECT_EQ(sent.error, ErrorKind::IO);
}

// ─── Receiver against a scripted peer ───────────────────────────────────────

TEST(ReceiverSessionTest, AcknowledgesEveryStep) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp / "inbox");
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"doc.pdf", 10});
    EXPECT_EQ(expect_ack(client), "Ready to receive file");
    send_data(client, "0123456789");
    EXPECT_EQ(expect_ack(client), "Received 10/10 bytes (100.0%)");
    MessageSender::send(client, MessageType::FEND, std::string());
    EXPECT_EQ(expect_ack(client), "File 'doc.pdf' received successfully");

    TransferResult received = receiver.get();
    ASSERT_TRUE(received.ok()) << received.detail;
    EXPECT_EQ(testing_support::read_file(tmp / "inbox" / "doc.pdf"), "0123456789");
}

TEST(ReceiverSessionTest, ZeroByteFileNeedsOnlyFend) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp.path());
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"empty", 0});
    expect_ack(client);
    MessageSender::send(client, MessageType::FEND, std::string());
    expect_ack(client);

    TransferResult received = receiver.get();
    ASSERT_TRUE(received.ok()) << received.detail;
    EXPECT_EQ(std::filesystem::file_size(tmp / "empty"), 0u);
}

TEST(ReceiverSessionTest, DataBeforeInfoIsRejected) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp.path());
    tcp::socket client = loop.connect();

    send_data(client, "0123456789");
    EXPECT_EQ(expect_err(client), "Expected file info message");

    TransferResult received = receiver.get();
    EXPECT_EQ(received.error, ErrorKind::PROTOCOL);
    EXPECT_TRUE(testing_support::list_dir(tmp.path()).empty());
}

TEST(ReceiverSessionTest, MalformedInfoIsRejected) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp.path());
    tcp::socket client = loop.connect();

    MessageSender::send(client, MessageType::FINFO, std::string("{\"filename\": \"a.txt\"}"));
    expect_err(client);

    EXPECT_EQ(receiver.get().error, ErrorKind::PROTOCOL);
    EXPECT_TRUE(testing_support::list_dir(tmp.path()).empty());
}

TEST(ReceiverSessionTest, TraversalNameIsRejected) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp / "inbox");
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"../..", 4});
    expect_err(client);

    EXPECT_EQ(receiver.get().error, ErrorKind::INVALID_FILENAME);
    EXPECT_EQ(testing_support::list_dir(tmp.path()), std::vector<std::string>{});
}

TEST(ReceiverSessionTest, TraversalPathIsFlattened) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp / "inbox");
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"../../escape.txt", 2});
    expect_ack(client);
    send_data(client, "hi");
    expect_ack(client);
    MessageSender::send(client, MessageType::FEND, std::string());
    expect_ack(client);

    ASSERT_TRUE(receiver.get().ok());
    EXPECT_EQ(testing_support::list_dir(tmp.path()), std::vector<std::string>{"inbox"});
    EXPECT_EQ(testing_support::read_file(tmp / "inbox" / "escape.txt"), "hi");
}

TEST(ReceiverSessionTest, EarlyEndDeletesPartialFile) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp.path());
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"short.bin", 10});
    expect_ack(client);
    send_data(client, "01234");
    expect_ack(client);
    MessageSender::send(client, MessageType::FEND, std::string());
    EXPECT_EQ(expect_err(client), "File transfer incomplete: 5/10 bytes");

    TransferResult received = receiver.get();
    EXPECT_EQ(received.error, ErrorKind::PROTOCOL);
    EXPECT_EQ(received.bytes_transferred, 5u);
    EXPECT_TRUE(testing_support::list_dir(tmp.path()).empty());
}

TEST(ReceiverSessionTest, DisconnectMidTransferDeletesPartialFile) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp.path());
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"big.bin", 10000});
    expect_ack(client);
    send_data(client, testing_support::pattern_bytes(protocol::kChunkSize));
    expect_ack(client);
    transfer::close_quietly(client);

    TransferResult received = receiver.get();
    EXPECT_EQ(received.error, ErrorKind::CONNECTION_CLOSED);
    EXPECT_EQ(received.bytes_transferred, protocol::kChunkSize);
    EXPECT_TRUE(testing_support::list_dir(tmp.path()).empty());
}

TEST(ReceiverSessionTest, MoreDataThanDeclaredIsRejected) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp.path());
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"a.txt", 3});
    expect_ack(client);
    send_data(client, "12345");
    expect_err(client);

    EXPECT_EQ(receiver.get().error, ErrorKind::PROTOCOL);
    EXPECT_TRUE(testing_support::list_dir(tmp.path()).empty());
}

TEST(ReceiverSessionTest, OversizedChunkIsRejected) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp.path());
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"a.bin", 100000});
    expect_ack(client);
    send_data(client, std::string(protocol::kChunkSize + 1, 'z'));
    expect_err(client);

    EXPECT_EQ(receiver.get().error, ErrorKind::PROTOCOL);
}

TEST(ReceiverSessionTest, UnexpectedMessageTypeIsRejected) {
    TempDir tmp;
    Loopback loop;
    auto receiver = receive_one(loop, tmp.path());
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"a.txt", 3});
    expect_ack(client);
    MessageSender::send_ack(client, "surprise");
    EXPECT_EQ(expect_err(client), "Unexpected message type: ACK");

    EXPECT_EQ(receiver.get().error, ErrorKind::PROTOCOL);
    EXPECT_TRUE(testing_support::list_dir(tmp.path()).empty());
}

TEST(ReceiverSessionTest, ExistingFileIsNotOverwritten) {
    TempDir tmp;
    testing_support::write_file(tmp / "x.txt", "keep me");

    Loopback loop;
    auto receiver = receive_one(loop, tmp.path());
    tcp::socket client = loop.connect();

    MessageSender::send_file_info(client, protocol::FileInfo{"x.txt", 3});
    expect_ack(client);
    send_data(client, "new");
    expect_ack(client);
    MessageSender::send(client, MessageType::FEND, std::string());
    EXPECT_EQ(expect_ack(client), "File 'x.txt' received successfully");

    TransferResult received = receiver.get();
    ASSERT_TRUE(received.ok());
    EXPECT_EQ(std::filesystem::path(received.path).filename().string(), "x_1.txt");
    EXPECT_EQ(testing_support::read_file(tmp / "x.txt"), "keep me");
    EXPECT_EQ(testing_support::read_file(tmp / "x_1.txt"), "new");
}
