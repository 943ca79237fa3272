/**
 * File I/O Test Suite
 *
 * Runs read/write/readdir/remove against the simulated device, including
 * reordered and lossy channels, and scripted replies for the listing and
 * error paths.
 */

#include "protocol/file_io.hpp"
#include "protocol/errors.hpp"
#include "sim/sim_device.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fileio;
using namespace fileio::protocol;
using fileio::sim::SimDevice;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

// ============================================================================
// Test Helpers
// ============================================================================

static Bytes randomBytes(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    Bytes data(n);
    for (auto& b : data) {
        b = static_cast<uint8_t>(rng() & 0xFF);
    }
    return data;
}

static FileIOConfig fastConfig() {
    FileIOConfig config;
    config.repeater.timeout_ms = 40;
    config.repeater.link_check_ms = 20;
    config.readdir_timeout_ms = 100;
    return config;
}

// Read replies seen on the wire, by the offset of the request they answer
static std::vector<std::pair<uint32_t, size_t>> readReplySizes(const SimDevice& device,
                                                               const Bytes& file) {
    std::vector<std::pair<uint32_t, size_t>> sizes;
    for (const auto& msg : device.sentMessages()) {
        auto req = ReadRequest::decode(msg);
        if (!req) continue;
        size_t n = 0;
        if (req->offset < file.size()) {
            n = std::min<size_t>(req->chunk_size, file.size() - req->offset);
        }
        sizes.emplace_back(req->offset, n);
    }
    return sizes;
}

// ============================================================================
// Write / Read Tests
// ============================================================================

bool test_write_read_600_bytes() {
    TEST("600-byte file in 251-byte chunks");

    SimDevice device;
    const std::string name = "f.bin";
    Bytes data = randomBytes(600, 1);

    // Payload budget that leaves exactly 251 data bytes per write
    FileIOConfig write_config;
    write_config.max_payload = 251 + WRITE_REQUEST_OVERHEAD + name.size();
    FileIO writer(device, SequenceGenerator(100), write_config);

    if (writer.writeChunkSize(name) != 251)
        FAIL("Unexpected write chunk size " + std::to_string(writer.writeChunkSize(name)));

    writer.write(name, data);

    std::vector<std::pair<uint32_t, size_t>> writes;
    for (const auto& msg : device.sentMessages()) {
        auto req = WriteRequest::decode(msg);
        if (req) writes.emplace_back(req->offset, req->data.size());
    }

    std::vector<std::pair<uint32_t, size_t>> expected = {{0, 251}, {251, 251}, {502, 98}};
    if (writes != expected)
        FAIL("Write requests do not match offsets 0/251/502 lengths 251/251/98");
    if (device.getFile(name) != data)
        FAIL("Device file differs from source");

    FileIO reader(device, SequenceGenerator(5000));
    if (reader.readChunkSize() != 251)
        FAIL("Unexpected read chunk size");

    Bytes back = reader.read(name);
    if (back != data)
        FAIL("Read back " + std::to_string(back.size()) + " bytes, expected identical 600");

    // The third reply is the short one (98 < 251)
    auto sizes = readReplySizes(device, data);
    if (sizes.size() < 3 || sizes[2].first != 502 || sizes[2].second != 98)
        FAIL("Expected terminal reply of 98 bytes at offset 502");

    PASS();
    return true;
}

bool test_write_truncate_removes_first() {
    TEST("Truncating write removes the file first");

    SimDevice device;
    device.setFile("cfg.ini", Bytes(1000, 'x'));

    FileIO f(device);
    Bytes data = {'n', 'e', 'w'};
    f.write("cfg.ini", data);

    auto sent = device.sentMessages();
    if (sent.empty() || sent[0].type != MsgType::REMOVE)
        FAIL("First message was not a remove");
    if (device.getFile("cfg.ini") != data)
        FAIL("Old contents survived the truncating write");

    PASS();
    return true;
}

bool test_write_at_offset_keeps_file() {
    TEST("Write at non-zero offset patches in place");

    SimDevice device;
    device.setFile("log.txt", Bytes{'a', 'b', 'c', 'd', 'e', 'f'});

    FileIO f(device);
    Bytes patch = {'X', 'Y'};
    f.write("log.txt", patch, 2, true);

    if (device.countSent(MsgType::REMOVE) != 0)
        FAIL("Remove sent for an offset write");
    Bytes expected = {'a', 'b', 'X', 'Y', 'e', 'f'};
    if (device.getFile("log.txt") != expected)
        FAIL("Patched file wrong");

    PASS();
    return true;
}

bool test_write_progress() {
    TEST("Progress reports cumulative bytes per scheduled chunk");

    SimDevice device;
    FileIO f(device);
    Bytes data = randomBytes(2000, 2);
    const size_t chunk = f.writeChunkSize("p.bin");

    std::vector<size_t> reports;
    f.write("p.bin", data, 0, true, [&](size_t scheduled) { reports.push_back(scheduled); });

    size_t expected_calls = (data.size() + chunk - 1) / chunk;
    if (reports.size() != expected_calls)
        FAIL("Expected " + std::to_string(expected_calls) + " reports, got " +
             std::to_string(reports.size()));
    for (size_t i = 0; i < reports.size(); i++) {
        size_t want = std::min(data.size(), (i + 1) * chunk);
        if (reports[i] != want)
            FAIL("Report " + std::to_string(i) + " was " + std::to_string(reports[i]));
    }

    PASS();
    return true;
}

bool test_write_progress_before_ack() {
    TEST("Progress runs as chunks are sent, before any reply");

    SimDevice device;
    FileIO f(device);
    Bytes data = randomBytes(20000, 6);
    const size_t chunk = f.writeChunkSize("held.bin");
    const size_t window = FileIOConfig{}.repeater.window_size;
    const size_t expected = std::min(data.size(), window * chunk);

    std::atomic<int> replies_delivered{0};
    link::Subscription counter(device, MsgType::WRITE_RESP,
                               [&](const Message&) { replies_delivered++; });

    std::atomic<size_t> scheduled{0};
    device.hold();
    std::thread writer([&] {
        f.write("held.bin", data, 0, true, [&](size_t n) { scheduled = n; });
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (scheduled < expected && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    // A full window stays put until replies arrive
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    size_t seen = scheduled;
    int delivered = replies_delivered;
    device.release();
    writer.join();

    if (delivered != 0)
        FAIL(std::to_string(delivered) + " replies delivered while held");
    if (seen != expected)
        FAIL("Progress at " + std::to_string(seen) + " while held, expected " +
             std::to_string(expected));
    if (scheduled != data.size())
        FAIL("Final progress " + std::to_string(scheduled.load()));
    if (device.getFile("held.bin") != data)
        FAIL("Device file differs after release");

    PASS();
    return true;
}

bool test_read_exact_multiple() {
    TEST("Read of exact chunk multiple ends on empty reply");

    SimDevice device;
    FileIO f(device);
    Bytes data = randomBytes(f.readChunkSize() * 3, 3);
    device.setFile("even.bin", data);

    Bytes back = f.read("even.bin");
    if (back != data)
        FAIL("Read " + std::to_string(back.size()) + " bytes, expected " + std::to_string(data.size()));

    PASS();
    return true;
}

bool test_read_missing_file() {
    TEST("Missing file reads as empty");

    SimDevice device;
    FileIO f(device);

    Bytes back = f.read("nope.bin");
    if (!back.empty())
        FAIL("Expected empty data");

    PASS();
    return true;
}

bool test_read_out_of_order() {
    TEST("Reordered replies reassemble correctly");

    for (uint32_t seed : {7u, 8u, 9u}) {
        SimDevice::Config dev_config;
        dev_config.latency_ms = 2;
        dev_config.jitter_ms = 25;
        SimDevice device(dev_config, seed);

        Bytes data = randomBytes(20000 + seed, seed);
        device.setFile("big.bin", data);

        FileIO f(device);
        Bytes back = f.read("big.bin");
        if (back != data)
            FAIL("Mismatch with seed " + std::to_string(seed));
        if (f.lastStats().peak_in_flight > 40)
            FAIL("Window bound exceeded");
    }

    PASS();
    return true;
}

bool test_lossy_round_trip() {
    TEST("Write and read over a lossy channel");

    SimDevice::Config dev_config;
    dev_config.drop_probability = 0.05;
    dev_config.jitter_ms = 5;
    SimDevice device(dev_config, 1234);

    FileIOConfig config = fastConfig();
    config.repeater.min_retries = 6;
    FileIO f(device, config);

    Bytes data = randomBytes(8000, 4);
    f.write("lossy.bin", data);
    if (device.getFile("lossy.bin") != data)
        FAIL("Device copy corrupted");

    Bytes back = f.read("lossy.bin");
    if (back != data)
        FAIL("Read back corrupted");

    if (device.getStats().requests_dropped + device.getStats().replies_dropped == 0)
        FAIL("Channel dropped nothing; test not exercising loss");

    PASS();
    return true;
}

bool test_write_dead_device() {
    TEST("Write to a silent device times out");

    SimDevice::Config dev_config;
    dev_config.respond = false;
    SimDevice device(dev_config);

    FileIO f(device, fastConfig());
    bool timed_out = false;
    try {
        f.write("x.bin", randomBytes(100, 5));
    } catch (const TransferTimeout&) {
        timed_out = true;
    }

    if (!timed_out)
        FAIL("Expected TransferTimeout");

    PASS();
    return true;
}

bool test_read_dead_device() {
    TEST("Read from a silent device times out");

    SimDevice::Config dev_config;
    dev_config.respond = false;
    SimDevice device(dev_config);

    FileIO f(device, fastConfig());
    bool timed_out = false;
    try {
        f.read("x.bin");
    } catch (const TransferTimeout&) {
        timed_out = true;
    }

    if (!timed_out)
        FAIL("Expected TransferTimeout");

    PASS();
    return true;
}

bool test_filename_too_long() {
    TEST("Filename leaving no room for data is rejected");

    SimDevice device;
    FileIO f(device);
    std::string name(250, 'n');

    bool threw = false;
    try {
        f.write(name, Bytes{1, 2, 3});
    } catch (const std::invalid_argument&) {
        threw = true;
    }

    if (!threw)
        FAIL("Expected std::invalid_argument");
    if (!device.sentMessages().empty())
        FAIL("Nothing should be sent");

    PASS();
    return true;
}

// ============================================================================
// Directory Listing Tests
// ============================================================================

bool test_readdir_pages() {
    TEST("Listing pages a\\0b\\0, c\\0, empty");

    SimDevice device;
    std::vector<uint32_t> offsets;
    device.setResponder([&](const Message& msg) {
        auto req = ReadDirRequest::decode(msg);
        offsets.push_back(req->offset);

        ReadDirReply reply;
        reply.sequence = req->sequence;
        if (req->offset == 0) {
            reply.contents = {'a', 0, 'b', 0};
        } else if (req->offset == 2) {
            reply.contents = {'c', 0};
        }
        return std::vector<Message>{reply.encode()};
    });

    FileIO f(device);
    auto names = f.readdir("/");

    std::vector<std::string> expected = {"a", "b", "c"};
    if (names != expected)
        FAIL("Listing wrong");
    if (offsets != std::vector<uint32_t>{0, 2, 3})
        FAIL("Pages requested at wrong offsets");

    PASS();
    return true;
}

bool test_readdir_device() {
    TEST("Listing a directory spanning several pages");

    SimDevice device;
    std::vector<std::string> expected;
    for (int i = 0; i < 40; i++) {
        char name[32];
        snprintf(name, sizeof(name), "file_%02d.txt", i);
        expected.push_back(name);
        device.setFile(std::string("logs/") + name, Bytes{1});
    }
    device.setFile("config.ini", Bytes{2});

    FileIO f(device);
    auto names = f.readdir("logs");
    if (names != expected)
        FAIL("Got " + std::to_string(names.size()) + " names, expected 40 in order");
    if (device.countSent(MsgType::READ_DIR_REQ) < 3)
        FAIL("Expected several pages");

    auto root = f.readdir();
    if (root != std::vector<std::string>{"config.ini"})
        FAIL("Root listing wrong");

    PASS();
    return true;
}

bool test_readdir_timeout() {
    TEST("Listing without reply fails");

    SimDevice::Config dev_config;
    dev_config.respond = false;
    SimDevice device(dev_config);

    FileIO f(device, fastConfig());
    bool threw = false;
    try {
        f.readdir();
    } catch (const ProtocolError&) {
        threw = true;
    }

    if (!threw)
        FAIL("Expected ProtocolError");

    PASS();
    return true;
}

bool test_readdir_mismatch() {
    TEST("Listing reply with wrong sequence fails");

    SimDevice device;
    device.setResponder([](const Message& msg) {
        ReadDirReply reply;
        reply.sequence = *sequenceOf(msg) + 1;
        reply.contents = {'a', 0};
        return std::vector<Message>{reply.encode()};
    });

    FileIO f(device, fastConfig());
    bool threw = false;
    try {
        f.readdir();
    } catch (const ProtocolError&) {
        threw = true;
    }

    if (!threw)
        FAIL("Expected ProtocolError");

    PASS();
    return true;
}

// ============================================================================
// Remove Tests
// ============================================================================

bool test_remove() {
    TEST("Remove is a single unacknowledged request");

    SimDevice device;
    device.setFile("old.bin", Bytes{1, 2, 3});

    FileIO f(device);
    f.remove("old.bin");

    auto sent = device.sentMessages();
    if (sent.size() != 1 || sent[0].type != MsgType::REMOVE)
        FAIL("Expected exactly one REMOVE");
    if (sequenceOf(sent[0]).has_value())
        FAIL("REMOVE should not carry a sequence");
    if (device.getFile("old.bin").has_value())
        FAIL("File still present");

    PASS();
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== File I/O Test Suite ===\n\n";

    std::cout << "Write/Read Tests:\n";
    test_write_read_600_bytes();
    test_write_truncate_removes_first();
    test_write_at_offset_keeps_file();
    test_write_progress();
    test_write_progress_before_ack();
    test_read_exact_multiple();
    test_read_missing_file();
    test_read_out_of_order();
    test_lossy_round_trip();

    std::cout << "\nFailure Tests:\n";
    test_write_dead_device();
    test_read_dead_device();
    test_filename_too_long();

    std::cout << "\nDirectory Listing Tests:\n";
    test_readdir_pages();
    test_readdir_device();
    test_readdir_timeout();
    test_readdir_mismatch();

    std::cout << "\nRemove Tests:\n";
    test_remove();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " tests passed ===\n";

    if (tests_passed == tests_run) {
        std::cout << "All tests PASSED!\n";
        return 0;
    } else {
        std::cout << "Some tests FAILED!\n";
        return 1;
    }
}
