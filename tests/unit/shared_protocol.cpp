#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/write.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "remcp/client/retry.hpp"
#include "remcp/config_file.hpp"
#include "remcp/error_codes.hpp"
#include "remcp/framing.hpp"
#include "remcp/protocol.hpp"
#include "remcp/resume.hpp"
#include "test_support.hpp"

using namespace remcp;
using namespace remcp::protocol;

void run_server_component_tests();
void run_client_transfer_tests();

namespace
{

    void test_request_encoding()
    {
        const TransferRequest get{.command = Command::Get, .path = "docs/a.txt", .offset = 12};
        assert(encode_request(get) == "GET docs/a.txt 12\n");

        const TransferRequest put{.command = Command::Put, .path = "b.bin", .offset = 0, .total_size = 4096};
        assert(encode_request(put) == "PUT b.bin 0 4096\n");

        ErrorKind error{ErrorKind::Other};
        const auto decoded = decode_request(encode_request(put), error);
        assert(decoded && *decoded == put);
    }

    void test_request_rejections()
    {
        ErrorKind error{ErrorKind::Other};

        assert(!decode_request("", error));
        assert(error == ErrorKind::InvalidCommand);

        assert(!decode_request("   \r\n", error));
        assert(error == ErrorKind::InvalidCommand);

        assert(!decode_request("DELETE a.txt 0", error));
        assert(error == ErrorKind::UnknownCommand);

        assert(!decode_request("GET a.txt", error));
        assert(error == ErrorKind::MissingArguments);

        assert(!decode_request("PUT a.txt 0", error));
        assert(error == ErrorKind::MissingArguments);

        assert(!decode_request("GET a.txt abc", error));
        assert(error == ErrorKind::InvalidCommand);

        assert(!decode_request("PUT a.txt 0 -5", error));
        assert(error == ErrorKind::InvalidCommand);

        // Verb is case-insensitive, trailing tokens are ignored.
        const auto lenient = decode_request("get a.txt 7 extra\r\n", error);
        assert(lenient);
        assert(lenient->command == Command::Get);
        assert(lenient->path == "a.txt");
        assert(lenient->offset == 7);
    }

    void test_response_decoding()
    {
        assert(decode_response("OK") == make_ok());
        assert(decode_response("OK 0\n") == make_ok(0));
        assert(decode_response("OK 123\r\n") == make_ok(123));
        assert(decode_response("NEXT 51") == make_next(51));

        assert(decode_response("ERR Invalid command").error == ErrorKind::InvalidCommand);
        assert(decode_response("ERR Missing arguments").error == ErrorKind::MissingArguments);
        assert(decode_response("ERR Unknown command").error == ErrorKind::UnknownCommand);
        assert(decode_response("ERR Server is busy").error == ErrorKind::ServerBusy);
        assert(decode_response("ERR Server busy").error == ErrorKind::ServerBusy);

        const auto file_error = decode_response("ERR FileError:No such file or directory");
        assert(file_error.kind == ResponseKind::Error);
        assert(file_error.error == ErrorKind::FileError);
        assert(file_error.detail == "No such file or directory");

        const auto other = decode_response("ERR disk on fire");
        assert(other.error == ErrorKind::Other);
        assert(other.detail == "disk on fire");

        for (const auto *garbage : {"", "HELLO", "OK abc", "OK 1 2", "NEXT", "NEXT x"})
        {
            const auto response = decode_response(garbage);
            assert(response.kind == ResponseKind::Error);
            assert(response.error == ErrorKind::Other);
            assert(response.detail == garbage);
        }
    }

    void test_response_encoding()
    {
        assert(encode_response(make_ok()) == "OK\n");
        assert(encode_response(make_ok(0)) == "OK 0\n");
        assert(encode_response(make_next(64)) == "NEXT 64\n");
        assert(encode_response(make_error(ErrorKind::ServerBusy)) == "ERR Server is busy\n");
        assert(encode_response(make_error(ErrorKind::FileError, "Is a directory")) == "ERR FileError:Is a directory\n");
        assert(encode_response(make_error(ErrorKind::Other, "boom")) == "ERR boom\n");
        assert(to_string(ErrorKind::FileError) == "file_error");
    }

    void test_line_channel()
    {
        asio::io_context io_context;
        asio::ip::tcp::socket client(io_context);
        asio::ip::tcp::socket server(io_context);
        remcp::test::connect_pair(io_context, client, server);

        // Control line and payload in one segment: the payload must come out of
        // read_up_to() rather than being lost in the line buffer.
        const std::string wire = "NEXT 5\nhello";
        asio::write(client, asio::buffer(wire));
        client.shutdown(asio::ip::tcp::socket::shutdown_send);

        LineChannel channel(server);
        const auto line = channel.read_line();
        assert(line && *line == "NEXT 5");

        std::vector<std::byte> payload(8);
        std::error_code ec;
        const auto count = channel.read_up_to(std::span<std::byte>(payload.data(), payload.size()), ec);
        assert(count == 5);
        assert(!ec);
        assert(std::string(reinterpret_cast<const char *>(payload.data()), count) == "hello");

        assert(!channel.read_line());
    }

    void test_line_channel_rejects_long_lines()
    {
        asio::io_context io_context;
        asio::ip::tcp::socket client(io_context);
        asio::ip::tcp::socket server(io_context);
        remcp::test::connect_pair(io_context, client, server);

        const std::string oversized(kMaxLineLength + 16, 'A');
        asio::write(client, asio::buffer(oversized));

        LineChannel channel(server);
        bool rejected = false;
        try
        {
            (void)channel.read_line();
        }
        catch (const std::system_error &ex)
        {
            rejected = ex.code() == asio::error::not_found;
        }
        assert(rejected);
    }

    void test_resume_markers()
    {
        remcp::test::TempDir dir("remcp_resume_test");
        const auto target = dir.path() / "data.bin";

        const auto empty = resume::locate(target);
        assert(empty.offset == 0);
        assert(empty.partial_path == dir.path() / "data.bin.part");

        remcp::test::write_file(empty.partial_path, "12345");
        assert(resume::locate(target).offset == 5);
        assert(resume::locate(target).offset == 5);

        resume::finalize(empty.partial_path, target);
        assert(!std::filesystem::exists(empty.partial_path));
        assert(remcp::test::read_file(target) == "12345");
        assert(resume::locate(target).offset == 0);

        remcp::test::write_file(empty.partial_path, "xy");
        resume::discard(empty.partial_path);
        assert(!std::filesystem::exists(empty.partial_path));

        bool failed = false;
        try
        {
            resume::finalize(dir.path() / "missing.part", dir.path() / "missing");
        }
        catch (const TransferError &ex)
        {
            failed = ex.kind() == ErrorKind::FileError;
        }
        assert(failed);
    }

    void test_config_file()
    {
        remcp::test::TempDir dir("remcp_config_test");
        const auto path = dir.path() / "remcp.json";
        remcp::test::write_file(path, R"({"port": 9000, "debug": true, "log_file": null})");

        const auto json = remcp::config::load_json_object(path);
        assert(remcp::config::optional_value<std::uint16_t>(json, "port") == std::optional<std::uint16_t>(9000));
        assert(remcp::config::optional_value<bool>(json, "debug") == std::optional<bool>(true));
        assert(!remcp::config::optional_value<std::string>(json, "log_file"));
        assert(!remcp::config::optional_value<std::string>(json, "absent"));

        bool wrong_type = false;
        try
        {
            (void)remcp::config::optional_value<std::string>(json, "port");
        }
        catch (const std::runtime_error &)
        {
            wrong_type = true;
        }
        assert(wrong_type);

        remcp::test::write_file(path, "[1, 2, 3]");
        bool not_object = false;
        try
        {
            (void)remcp::config::load_json_object(path);
        }
        catch (const std::runtime_error &)
        {
            not_object = true;
        }
        assert(not_object);

        bool missing = false;
        try
        {
            (void)remcp::config::load_json_object(dir.path() / "nope.json");
        }
        catch (const std::runtime_error &)
        {
            missing = true;
        }
        assert(missing);
    }

    void test_retry_predicate()
    {
        using remcp::client::is_retryable;
        assert(is_retryable(TransferError(ErrorKind::ServerBusy, "busy")));
        assert(is_retryable(TransferError(ErrorKind::Other, "reset", asio::error::connection_reset)));
        assert(is_retryable(TransferError(ErrorKind::Other, "timeout", asio::error::timed_out)));
        assert(!is_retryable(TransferError(ErrorKind::Other, "refused", asio::error::connection_refused)));
        assert(!is_retryable(TransferError(ErrorKind::FileError, "denied")));
        assert(!is_retryable(TransferError(ErrorKind::InvalidCommand, "bad")));
    }

    void test_attempt_with_retry()
    {
        using namespace std::chrono_literals;
        using remcp::client::attempt_with_retry;
        using remcp::client::RetryPolicy;

        std::vector<std::chrono::milliseconds> sleeps;
        const SleepFunction record = [&](std::chrono::milliseconds duration)
        { sleeps.push_back(duration); };
        const auto ignore = [](std::size_t, const TransferError &) {};

        RetryPolicy policy;
        policy.max_attempts = 3;
        policy.backoff = 250ms;

        // Always busy: three calls, two sleeps, last error rethrown.
        std::size_t calls = 0;
        bool exhausted = false;
        try
        {
            attempt_with_retry(
                policy, record, [&](std::size_t) -> int
                {
                    ++calls;
                    throw TransferError(ErrorKind::ServerBusy, "busy"); },
                ignore);
        }
        catch (const TransferError &ex)
        {
            exhausted = ex.kind() == ErrorKind::ServerBusy;
        }
        assert(exhausted);
        assert(calls == 3);
        assert(sleeps == std::vector<std::chrono::milliseconds>({250ms, 250ms}));

        // Non-retryable errors escape on the first attempt.
        calls = 0;
        sleeps.clear();
        bool aborted = false;
        try
        {
            attempt_with_retry(
                policy, record, [&](std::size_t) -> int
                {
                    ++calls;
                    throw TransferError(ErrorKind::FileError, "denied"); },
                ignore);
        }
        catch (const TransferError &ex)
        {
            aborted = ex.kind() == ErrorKind::FileError;
        }
        assert(aborted);
        assert(calls == 1);
        assert(sleeps.empty());

        // Succeeds on the second attempt and reports it.
        std::vector<std::size_t> retried;
        const auto result = attempt_with_retry(
            policy, record, [&](std::size_t attempt) -> std::size_t
            {
                if (attempt == 1)
                {
                    throw TransferError(ErrorKind::Other, "reset", asio::error::connection_reset);
                }
                return attempt; },
            [&](std::size_t attempt, const TransferError &) { retried.push_back(attempt); });
        assert(result == 2);
        assert(retried == std::vector<std::size_t>({1}));
        assert(sleeps.size() == 1);

        // Zero attempts still runs once.
        policy.max_attempts = 0;
        calls = 0;
        bool single = false;
        try
        {
            attempt_with_retry(
                policy, record, [&](std::size_t) -> int
                {
                    ++calls;
                    throw TransferError(ErrorKind::ServerBusy, "busy"); },
                ignore);
        }
        catch (const TransferError &)
        {
            single = true;
        }
        assert(single);
        assert(calls == 1);
    }

} // namespace

int main()
{
    try
    {
        test_request_encoding();
        test_request_rejections();
        test_response_decoding();
        test_response_encoding();
        test_line_channel();
        test_line_channel_rejects_long_lines();
        test_resume_markers();
        test_config_file();
        test_retry_predicate();
        test_attempt_with_retry();
        run_server_component_tests();
        run_client_transfer_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed\n";
    return 0;
}
