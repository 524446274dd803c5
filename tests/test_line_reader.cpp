/**
 * @file test_line_reader.cpp
 * @brief Unit tests for newline framing, run over a pipe.
 */

#include <ut803/line_reader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

#include <unistd.h>

using namespace ut803;

namespace {

// Pipe with both ends closed on scope exit.
class TestPipe {
public:
    TestPipe() {
        REQUIRE(::pipe(fds_) == 0);
    }

    ~TestPipe() {
        close_write();
        ::close(fds_[0]);
    }

    int read_fd() const {
        return fds_[0];
    }

    void write(const std::string& data) {
        REQUIRE(::write(fds_[1], data.data(), data.size()) ==
                static_cast<ssize_t>(data.size()));
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

} // namespace

TEST_CASE("Single record keeps its terminator", "[line_reader]") {
    TestPipe pipe;
    LineReader reader(pipe.read_fd());
    pipe.write("41234;03:\r\n");

    std::string line;
    REQUIRE(reader.read_line(line, 1000) == Error::Ok);
    REQUIRE(line == "41234;03:\r\n");
    REQUIRE(line.size() == FRAME_LENGTH);
    REQUIRE(reader.pending() == 0);
}

TEST_CASE("Several records in one read", "[line_reader]") {
    TestPipe pipe;
    LineReader reader(pipe.read_fd());
    pipe.write("41234;03:\r\n050006000\r\n0012");

    std::string line;
    REQUIRE(reader.read_line(line, 1000) == Error::Ok);
    REQUIRE(line == "41234;03:\r\n");
    REQUIRE(reader.read_line(line, 1000) == Error::Ok);
    REQUIRE(line == "050006000\r\n");
    REQUIRE(reader.pending() == 4);
}

TEST_CASE("Record split across reads", "[line_reader]") {
    TestPipe pipe;
    LineReader reader(pipe.read_fd());
    pipe.write("41234");

    std::string line;
    REQUIRE(reader.read_line(line, 20) == Error::Timeout);
    REQUIRE(line == "41234");
    REQUIRE(reader.pending() == 0);

    // The tail after a timeout is a short record the caller drops by length
    pipe.write(";03:\r\n");
    REQUIRE(reader.read_line(line, 1000) == Error::Ok);
    REQUIRE(line == ";03:\r\n");
}

TEST_CASE("Timeout with nothing buffered", "[line_reader]") {
    TestPipe pipe;
    LineReader reader(pipe.read_fd());

    std::string line = "stale";
    REQUIRE(reader.read_line(line, 10) == Error::Timeout);
    REQUIRE(line.empty());
}

TEST_CASE("End of stream", "[line_reader]") {
    TestPipe pipe;
    LineReader reader(pipe.read_fd());
    pipe.write("41234;03:\r\n");
    pipe.close_write();

    std::string line;
    REQUIRE(reader.read_line(line, 1000) == Error::Ok);
    REQUIRE(reader.read_line(line, 1000) == Error::Io);
    REQUIRE(reader.last_errno() == 0);
}

TEST_CASE("Overlong record is handed out unterminated", "[line_reader]") {
    TestPipe pipe;
    LineReader reader(pipe.read_fd());
    pipe.write(std::string(MAX_LINE_LENGTH + 10, 'x'));

    std::string line;
    REQUIRE(reader.read_line(line, 1000) == Error::Ok);
    REQUIRE(line.size() >= MAX_LINE_LENGTH);
    REQUIRE(line.find('\n') == std::string::npos);
}

TEST_CASE("Bad descriptor", "[line_reader]") {
    LineReader reader(-1);
    std::string line;
    REQUIRE(reader.read_line(line, 10) == Error::Io);
}

TEST_CASE("Zero timeout still returns a waiting record", "[line_reader]") {
    TestPipe pipe;
    LineReader reader(pipe.read_fd());
    pipe.write("41234;03:\r\n");

    std::string line;
    REQUIRE(reader.read_line(line, 0) == Error::Ok);
    REQUIRE(line == "41234;03:\r\n");

    SECTION("nothing waiting times out without blocking") {
        REQUIRE(reader.read_line(line, 0) == Error::Timeout);
        REQUIRE(line.empty());
    }

    SECTION("partial record is handed out on timeout") {
        pipe.write("0500");
        REQUIRE(reader.read_line(line, 0) == Error::Timeout);
        REQUIRE(line == "0500");
        REQUIRE(reader.pending() == 0);
    }
}

TEST_CASE("Zero timeout drains a burst larger than one read", "[line_reader]") {
    TestPipe pipe;
    LineReader reader(pipe.read_fd());
    std::string burst;
    for (int i = 0; i < 10; ++i) {
        burst += "41234;03:\r\n";
    }
    pipe.write(burst);

    std::string line;
    for (int i = 0; i < 10; ++i) {
        REQUIRE(reader.read_line(line, 0) == Error::Ok);
        REQUIRE(line == "41234;03:\r\n");
    }
    REQUIRE(reader.read_line(line, 0) == Error::Timeout);
}
