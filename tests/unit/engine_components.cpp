#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "lanxfer/engine/config.hpp"
#include "lanxfer/engine/device_info.hpp"
#include "lanxfer/engine/filesystem.hpp"
#include "lanxfer/engine/lifecycle.hpp"
#include "lanxfer/engine/notifier.hpp"
#include "lanxfer/engine/progress.hpp"
#include "lanxfer/engine/session.hpp"
#include "lanxfer/engine/session_registry.hpp"
#include "lanxfer/error_codes.hpp"

using namespace lanxfer;
using namespace lanxfer::engine;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void write_file(const std::filesystem::path &path, std::size_t size, char fill)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << std::string(size, fill);
    }

    template <typename Fn>
    ErrorCode error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const TransferError &ex)
        {
            return ex.code();
        }
        return ErrorCode::Ok;
    }

    std::shared_ptr<Session> make_sender(const std::string &id, const std::string &code)
    {
        auto session = std::make_shared<Session>(id, Role::Send, SessionStatus::Waiting);
        session->pairing_code = code;
        return session;
    }

    void test_session_transitions()
    {
        Session sender("s-1", Role::Send, SessionStatus::Waiting);
        assert(sender.sender_session_id == "s-1");
        assert(!sender.start_time.has_value());
        assert(!sender.transition(SessionStatus::Completed));
        assert(sender.transition(SessionStatus::Transferring));
        assert(sender.start_time.has_value());
        assert(!sender.transition(SessionStatus::Waiting));
        assert(sender.transition(SessionStatus::Completed));
        assert(sender.terminal());
        assert(!sender.transition(SessionStatus::Failed));
        assert(!sender.transition(SessionStatus::Cancelled));
        assert(sender.status == SessionStatus::Completed);

        Session receiver("r-1", Role::Receive, SessionStatus::Transferring);
        assert(receiver.receiver_session_id == "r-1");
        assert(receiver.wire_session_id() == "r-1");
        assert(receiver.start_time.has_value());
        assert(receiver.transition(SessionStatus::Cancelled));
        assert(!receiver.transition(SessionStatus::Completed));
        assert(receiver.status == SessionStatus::Cancelled);

        Session waiting("s-2", Role::Send, SessionStatus::Waiting);
        assert(waiting.transition(SessionStatus::Cancelled));

        assert(to_string(SessionStatus::Transferring) == "transferring");
        assert(to_string(Role::Receive) == "receive");
    }

    void test_registry_matching()
    {
        SessionRegistry registry;
        registry.add(make_sender("a", "111111"));
        registry.add(make_sender("b", "222222"));
        registry.add(make_sender("c", "111111"));
        assert(registry.size() == 3);

        auto first = registry.find_first(SessionStatus::Waiting, Role::Send, "111111");
        assert(first && first->id == "a");
        assert(!registry.find_first(SessionStatus::Waiting, Role::Receive, "111111"));
        assert(!registry.find_first(SessionStatus::Waiting, Role::Send, "999999"));

        const auto bind = [](Session &session)
        {
            session.transition(SessionStatus::Transferring);
            session.peer_name = "peer";
        };

        auto bound = registry.bind_waiting_sender("111111", bind);
        assert(bound && bound->id == "a");
        assert(bound->status == SessionStatus::Transferring);

        // The first session is no longer waiting, so the same code reaches the next one.
        auto second = registry.bind_waiting_sender("111111", bind);
        assert(second && second->id == "c");
        assert(!registry.bind_waiting_sender("111111", bind));
        assert(registry.find("b")->status == SessionStatus::Waiting);

        assert(registry.remove("b"));
        assert(!registry.find("b"));
        assert(!registry.remove("b"));
        const auto all = registry.all();
        assert(all.size() == 2 && all[0]->id == "a" && all[1]->id == "c");

        const auto removed = registry.clear();
        assert(removed.size() == 2);
        assert(registry.size() == 0);
    }

    void test_pairing_isolation_under_contention()
    {
        SessionRegistry registry;
        registry.add(make_sender("x", "100001"));
        registry.add(make_sender("y", "100002"));

        std::vector<std::future<std::string>> results;
        for (int i = 0; i < 8; ++i)
        {
            const auto code = i % 2 == 0 ? "100001" : "100002";
            results.push_back(std::async(std::launch::async, [&registry, code]
                                         {
                                             auto session = registry.bind_waiting_sender(code, [](Session &s)
                                                                                         { s.transition(SessionStatus::Transferring); });
                                             return session ? session->id : std::string(); }));
        }

        int x_bound = 0;
        int y_bound = 0;
        for (auto &result : results)
        {
            const auto id = result.get();
            x_bound += id == "x" ? 1 : 0;
            y_bound += id == "y" ? 1 : 0;
        }
        assert(x_bound == 1);
        assert(y_bound == 1);
    }

    void test_manifest()
    {
        const auto root = std::filesystem::temp_directory_path() / "lanxfer_manifest_test";
        cleanup_path(root);
        write_file(root / "dirA" / "file.txt", 10, 'a');
        write_file(root / "dirA" / "sub" / "file2.txt", 20, 'b');
        write_file(root / "dirA" / "b.txt", 5, 'c');
        std::filesystem::create_directories(root / "dirA" / "empty");
        write_file(root / "single.bin", 7, 'd');

        const auto manifest = build_manifest({root / "dirA", root / "single.bin"});
        std::vector<std::string> order;
        for (const auto &entry : manifest.files)
        {
            order.push_back(entry.relative_path);
        }
        const std::vector<std::string> expected{
            "dirA", "dirA/b.txt", "dirA/empty", "dirA/file.txt", "dirA/sub", "dirA/sub/file2.txt", "single.bin",
        };
        assert(order == expected);
        assert(manifest.sources.size() == manifest.files.size());
        assert(manifest.files[0].is_directory && manifest.files[0].size == 0);
        assert(manifest.files[5].name == "file2.txt");

        std::uint64_t sum = 0;
        for (const auto &entry : manifest.files)
        {
            if (!entry.is_directory)
            {
                sum += entry.size;
            }
        }
        assert(sum == manifest.total_size);
        assert(manifest.total_size == 42);

        const auto trailing = build_manifest({root / "dirA" / ""});
        assert(trailing.files.front().relative_path == "dirA");

        assert(error_of([&]
                        { (void)build_manifest({root / "missing"}); }) == ErrorCode::NotFound);
        cleanup_path(root);
    }

    void test_path_guard()
    {
        const std::filesystem::path base = "/tmp/lanxfer_save";
        assert(resolve_under(base, "dirA/file.txt") == base / "dirA" / "file.txt");
        assert(resolve_under(base, "./dirA") == base / "dirA");
        assert(resolve_under(base, "name..with..dots") == base / "name..with..dots");

        assert(error_of([&]
                        { (void)resolve_under(base, "../escape.txt"); }) == ErrorCode::PathRejected);
        assert(error_of([&]
                        { (void)resolve_under(base, "dirA/../../escape.txt"); }) == ErrorCode::PathRejected);
        assert(error_of([&]
                        { (void)resolve_under(base, "/etc/passwd"); }) == ErrorCode::PathRejected);
        assert(error_of([&]
                        { (void)resolve_under(base, ""); }) == ErrorCode::PathRejected);
        assert(error_of([&]
                        { (void)resolve_under(base, "."); }) == ErrorCode::PathRejected);
    }

    void test_progress()
    {
        assert(progress::percent(0, 0) == 0);
        assert(progress::percent(50, 100) == 50);
        assert(progress::percent(2, 3) == 66);
        assert(progress::percent(100, 100) == 100);
        assert(progress::percent(150, 100) == 100);

        assert(progress::throughput(1000, std::chrono::seconds(0)) == 0.0);
        assert(progress::throughput(2048, std::chrono::seconds(2)) == 1024.0);

        assert(progress::format_size(0) == "0 B");
        assert(progress::format_size(1023) == "1023 B");
        assert(progress::format_size(1024) == "1.0 KB");
        assert(progress::format_size(1536) == "1.5 KB");
        assert(progress::format_size(5.5 * 1024 * 1024) == "5.5 MB");
        assert(progress::format_size(3.0 * 1024 * 1024 * 1024) == "3.00 GB");
        assert(progress::format_speed(0) == "0 B/s");

        Session session("p-1", Role::Receive, SessionStatus::Transferring);
        session.total_size = 0;
        const auto empty = progress::sample(session, *session.start_time);
        assert(empty.percent == 0);
        assert(empty.speed == "0 B/s");

        session.total_size = 4096;
        session.transferred_size = 1024;
        const auto later = progress::sample(session, *session.start_time + std::chrono::seconds(1));
        assert(later.percent == 25);
        assert(later.bytes_per_second == 1024.0);
        assert(later.speed == "1.0 KB/s");
    }

    void test_notifier_filters()
    {
        Notifier notifier;
        std::vector<std::string> by_kind;
        std::vector<std::string> by_session;
        int everything = 0;

        notifier.subscribe(NotificationKind::TransferCompleted, [&](const Notification &n)
                           { by_kind.push_back(n.session_id); });
        const auto session_sub = notifier.subscribe_session("s-2", [&](const Notification &n)
                                                            { by_session.emplace_back(to_string(n.kind)); });
        notifier.subscribe_all([&](const Notification &)
                               { ++everything; });
        notifier.subscribe_all([](const Notification &)
                               { throw std::runtime_error("subscriber failure"); });

        notifier.publish(Notification{.kind = NotificationKind::TransferCompleted, .session_id = "s-1"});
        notifier.publish(Notification{.kind = NotificationKind::TransferProgress, .session_id = "s-2"});
        notifier.publish(Notification{.kind = NotificationKind::TransferCompleted, .session_id = "s-2"});

        assert((by_kind == std::vector<std::string>{"s-1", "s-2"}));
        assert((by_session == std::vector<std::string>{"transfer-progress", "transfer-completed"}));
        assert(everything == 3);

        notifier.unsubscribe(session_sub);
        notifier.publish(Notification{.kind = NotificationKind::FileSent, .session_id = "s-2"});
        assert(by_session.size() == 2);
        assert(everything == 4);
    }

    void test_lifecycle()
    {
        Notifier notifier;
        SessionLifecycle lifecycle(notifier);
        std::vector<NotificationKind> seen;
        notifier.subscribe_all([&](const Notification &n)
                               { seen.push_back(n.kind); });

        Session receiver("r-9", Role::Receive, SessionStatus::Transferring);
        receiver.pending_request = std::make_shared<std::promise<std::string>>();
        auto future = receiver.pending_request->get_future();

        assert(lifecycle.fail(receiver, ErrorCode::PeerError, "Invalid pairing code or no pending transfer"));
        assert(!lifecycle.cancel(receiver));
        assert(!lifecycle.complete(receiver));
        assert(!receiver.pending_request);
        assert(error_of([&]
                        { (void)future.get(); }) == ErrorCode::PeerError);
        assert((seen == std::vector<NotificationKind>{NotificationKind::TransferError}));

        Session sender("s-9", Role::Send, SessionStatus::Waiting);
        sender.transition(SessionStatus::Transferring);
        assert(lifecycle.complete(sender));
        assert(sender.status == SessionStatus::Completed);
        assert(seen.back() == NotificationKind::TransferCompleted);
    }

    void test_config_and_device()
    {
        assert(packet_policy_from_string("drop") == PacketPolicy::Drop);
        assert(packet_policy_from_string("reply-error") == PacketPolicy::ReplyError);
        assert(packet_policy_from_string("reply_error") == PacketPolicy::ReplyError);
        assert(!packet_policy_from_string("explode").has_value());

        const TransferConfig defaults;
        assert(defaults.port == 45679);
        assert(defaults.chunk_size == 64 * 1024);

        const auto id = derive_device_id("host", "aa:bb:cc:dd:ee:ff");
        assert(id.size() == 32);
        assert(id == derive_device_id("host", "aa:bb:cc:dd:ee:ff"));
        assert(id != derive_device_id("other", "aa:bb:cc:dd:ee:ff"));

        const auto info = detect_device_info(std::string("Test Box"), 1234);
        assert(info.device_name == "Test Box");
        assert(info.port == 1234);
        assert(info.device_id.size() == 32);
    }

} // namespace

void run_engine_component_tests()
{
    test_session_transitions();
    test_registry_matching();
    test_pairing_isolation_under_contention();
    test_manifest();
    test_path_guard();
    test_progress();
    test_notifier_filters();
    test_lifecycle();
    test_config_and_device();
}
