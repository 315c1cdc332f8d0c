#include "test_socket_pair.hpp"
#include "vlc/portal/session.hpp"
#include "vlc/core/protobuf/vlc.pb.h"
#include "vlc/error.hpp"
#include <boost/asio.hpp>
#include <iostream>
#include <map>
#include <thread>

using namespace vlc;
using namespace vlc::datamodel;

namespace spb = vlc::core::protobuf;

namespace {

attested_clock make_attested(const ordinary_clock & plain,
    const std::string & document)
{
    spb::AttestedClock pb_clock;
    plain.to_protobuf(*pb_clock.mutable_plain());
    pb_clock.set_document(document);
    return attested_clock::from_protobuf(pb_clock);
}

update_request make_request(uint64_t request_id)
{
    return update_request(request_id,
        attested_clock::from_genesis(ordinary_clock()),
        std::vector<attested_clock>(), 1);
}

struct harness
{
    core::io_service_ptr_t io_srv;
    portal::session_ptr_t session;
    int peer_fd;

    bool completed;
    boost::system::error_code result;

    explicit harness(uint64_t max_frame_length = core::frame::default_max_length)
     :  io_srv(std::make_shared<boost::asio::io_service>()),
        completed(false)
    {
        test::socket_pair pair = test::make_socket_pair(io_srv);
        peer_fd = pair.peer_fd;

        session = std::make_shared<portal::session>(
            std::move(pair.local), io_srv, max_frame_length);
    }

    ~harness()
    {
        if(peer_fd >= 0)
            ::close(peer_fd);
    }

    void start()
    {
        session->start(
            [this](boost::system::error_code ec)
            {
                VLC_ASSERT(!completed);
                completed = true;
                result = ec;
            });
    }

    void close_peer()
    {
        ::close(peer_fd);
        peer_fd = -1;
    }
};

void test_responses_routed_by_request_id()
{
    harness h;

    // the simulated worker answers in the order 3, 1, 2
    std::thread worker([peer_fd = h.peer_fd]()
        {
            std::map<uint64_t, update_request> requests;
            for(unsigned i = 0; i != 3; ++i)
            {
                std::string payload;
                VLC_ASSERT(test::read_frame(peer_fd, payload));

                update_request request = update_request::parse(payload);
                requests.insert(std::make_pair(request.request_id, request));
            }

            for(uint64_t request_id : {3, 1, 2})
            {
                VLC_ASSERT(requests.count(request_id));

                ordinary_clock plain = {{request_id, request_id * 10}};
                update_response response(request_id,
                    make_attested(plain, "doc-" + std::to_string(request_id)),
                    std::vector<uint64_t>(update_stage_count, 1));

                test::write_frame(peer_fd, response.serialize());
            }
            test::drain_until_closed(peer_fd);
        });

    std::map<uint64_t, update_response> received;
    std::vector<uint64_t> arrival_order;

    h.start();

    for(uint64_t request_id = 1; request_id != 4; ++request_id)
    {
        h.session->submit(make_request(request_id),
            [&, request_id](boost::system::error_code ec,
                boost::optional<update_response> response)
            {
                VLC_ASSERT(!ec && response);
                VLC_ASSERT(response->request_id == request_id);

                arrival_order.push_back(request_id);
                received.insert(std::make_pair(request_id, *response));

                if(received.size() == 3)
                {
                    h.session->close_requests();
                }
            });
    }

    h.io_srv->run();
    worker.join();

    VLC_ASSERT(h.completed && !h.result);
    VLC_ASSERT(received.size() == 3);
    VLC_ASSERT((arrival_order == std::vector<uint64_t>{3, 1, 2}));

    for(const auto & entry : received)
    {
        ordinary_clock expected = {{entry.first, entry.first * 10}};
        VLC_ASSERT(entry.second.updated.get_plain() == expected);
        VLC_ASSERT(entry.second.updated.get_document() ==
            "doc-" + std::to_string(entry.first));
    }
    VLC_ASSERT(h.session->get_responses().pending_count() == 0);

    std::cout << "[PASS] test_responses_routed_by_request_id" << std::endl;
}

void test_clean_drain_completes()
{
    harness h;

    std::thread worker([peer_fd = h.peer_fd]()
        {
            std::string payload;
            for(unsigned i = 0; i != 2; ++i)
            {
                VLC_ASSERT(test::read_frame(peer_fd, payload));
                VLC_ASSERT(update_request::parse(payload).request_id == i + 1);
            }
            test::drain_until_closed(peer_fd);
        });

    // requests queued ahead of the close are still written
    h.session->get_requests().push(make_request(1));
    h.session->get_requests().push(make_request(2));
    h.session->close_requests();

    h.start();
    h.io_srv->run();
    worker.join();

    VLC_ASSERT(h.completed && !h.result);
    VLC_ASSERT(h.session->is_finished());
    VLC_ASSERT(!h.session->is_open());

    std::cout << "[PASS] test_clean_drain_completes" << std::endl;
}

void test_read_failure_dominates()
{
    harness h;

    // the worker is gone before the session starts
    h.close_peer();

    boost::system::error_code waiter_ec;
    h.session->submit(make_request(1),
        [&](boost::system::error_code ec, boost::optional<update_response> r)
        {
            VLC_ASSERT(!r);
            waiter_ec = ec;
        });
    h.session->close_requests();

    h.start();
    h.io_srv->run();

    // the writer's outcome (a drain, or a failed write) loses to the reader
    VLC_ASSERT(h.completed);
    VLC_ASSERT(h.result == boost::asio::error::eof);
    VLC_ASSERT(waiter_ec == boost::asio::error::eof);

    std::cout << "[PASS] test_read_failure_dominates" << std::endl;
}

void test_truncated_frames()
{
    // closed in the payload
    {
        harness h;
        test::write_all(h.peer_fd,
            core::frame::encode_header(100) + std::string(10, 'x'));
        h.close_peer();

        h.start();
        h.io_srv->run();

        VLC_ASSERT(h.result == error::protocol_errc::truncated);
    }
    // closed in the header
    {
        harness h;
        test::write_all(h.peer_fd, std::string(3, '\0'));
        h.close_peer();

        h.start();
        h.io_srv->run();

        VLC_ASSERT(h.result == error::protocol_errc::truncated);
    }

    std::cout << "[PASS] test_truncated_frames" << std::endl;
}

void test_malformed_frames()
{
    // declared length over the session's maximum
    {
        harness h(1024);

        std::thread worker([peer_fd = h.peer_fd]()
            {
                test::write_all(peer_fd, core::frame::encode_header(4096));
                test::drain_until_closed(peer_fd);
            });

        h.start();
        h.io_srv->run();
        worker.join();

        VLC_ASSERT(h.result == error::protocol_errc::malformed);
    }
    // a frame which doesn't decode as a response
    {
        harness h;

        std::thread worker([peer_fd = h.peer_fd]()
            {
                test::write_frame(peer_fd, "not a response");
                test::drain_until_closed(peer_fd);
            });

        h.start();
        h.io_srv->run();
        worker.join();

        VLC_ASSERT(h.result == error::protocol_errc::malformed);
    }

    std::cout << "[PASS] test_malformed_frames" << std::endl;
}

void test_cancel_fails_waiters()
{
    harness h;

    std::thread worker([peer_fd = h.peer_fd]()
        {
            test::drain_until_closed(peer_fd);
        });

    std::vector<boost::system::error_code> failures;
    auto record = [&](boost::system::error_code ec,
        boost::optional<update_response> response)
    {
        VLC_ASSERT(!response);
        failures.push_back(ec);
    };

    h.start();
    h.session->submit(make_request(1), record);
    h.session->cancel();

    // submitted after the session ended
    h.io_srv->post([&]() { h.session->submit(make_request(2), record); });

    h.io_srv->run();
    worker.join();

    VLC_ASSERT(h.result == boost::asio::error::operation_aborted);
    VLC_ASSERT(failures.size() == 2);
    VLC_ASSERT(failures[0] == boost::asio::error::operation_aborted);
    VLC_ASSERT(failures[1] == boost::asio::error::operation_aborted);

    std::cout << "[PASS] test_cancel_fails_waiters" << std::endl;
}

void test_response_table_holds_early_responses()
{
    core::io_service_ptr_t io_srv = std::make_shared<boost::asio::io_service>();
    portal::response_table table(io_srv, true);

    VLC_ASSERT(table.publish(update_response(5,
        make_attested(ordinary_clock{{1, 1}}, "first"),
        std::vector<uint64_t>())));

    // a second response of a held id is dropped
    VLC_ASSERT(!table.publish(update_response(5,
        make_attested(ordinary_clock{{1, 2}}, "second"),
        std::vector<uint64_t>())));

    VLC_ASSERT(table.held_count() == 1);

    boost::optional<update_response> taken = table.take(5);
    VLC_ASSERT(taken && taken->updated.get_document() == "first");
    VLC_ASSERT(!table.take(5));

    table.publish(update_response(6,
        make_attested(ordinary_clock{{1, 3}}, "third"),
        std::vector<uint64_t>()));

    bool delivered = false;
    table.async_wait(6,
        [&](boost::system::error_code ec, boost::optional<update_response> r)
        {
            VLC_ASSERT(!ec && r && r->request_id == 6);
            delivered = true;
        });

    // waiters are invoked from the io_service
    VLC_ASSERT(!delivered);
    io_srv->run();
    VLC_ASSERT(delivered);

    std::cout << "[PASS] test_response_table_holds_early_responses" << std::endl;
}

void test_response_table_drops_unclaimed_responses()
{
    core::io_service_ptr_t io_srv = std::make_shared<boost::asio::io_service>();
    portal::response_table table(io_srv, false);

    boost::system::error_code waiter_ec;
    table.async_wait(1,
        [&](boost::system::error_code ec, boost::optional<update_response> r)
        {
            VLC_ASSERT(!r);
            waiter_ec = ec;
        });
    table.fail(1, boost::asio::error::timed_out);

    // late responses to the failed waiter, and unsolicited ones
    for(uint64_t request_id = 0; request_id != 1000; ++request_id)
    {
        VLC_ASSERT(!table.publish(update_response(request_id % 2 ? 1 : request_id,
            make_attested(ordinary_clock(), ""), std::vector<uint64_t>())));
    }

    VLC_ASSERT(table.held_count() == 0);
    VLC_ASSERT(table.pending_count() == 0);

    io_srv->run();
    VLC_ASSERT(waiter_ec == boost::asio::error::timed_out);

    std::cout << "[PASS] test_response_table_drops_unclaimed_responses"
        << std::endl;
}

void test_session_drops_unsolicited_responses()
{
    harness h;

    std::thread worker([peer_fd = h.peer_fd]()
        {
            std::string payload;
            VLC_ASSERT(test::read_frame(peer_fd, payload));
            VLC_ASSERT(update_request::parse(payload).request_id == 1);

            // unsolicited, answered, then duplicated
            for(uint64_t request_id : {99, 1, 1})
            {
                update_response response(request_id,
                    make_attested(ordinary_clock{{1, 1}}, "doc"),
                    std::vector<uint64_t>());

                test::write_frame(peer_fd, response.serialize());
            }
            test::drain_until_closed(peer_fd);
        });

    unsigned deliveries = 0;

    h.start();
    h.session->submit(make_request(1),
        [&](boost::system::error_code ec, boost::optional<update_response> r)
        {
            VLC_ASSERT(!ec && r && r->request_id == 1);
            ++deliveries;

            h.session->close_requests();
        });

    h.io_srv->run();
    worker.join();

    VLC_ASSERT(h.completed && !h.result);
    VLC_ASSERT(deliveries == 1);
    VLC_ASSERT(h.session->get_responses().held_count() == 0);

    std::cout << "[PASS] test_session_drops_unsolicited_responses" << std::endl;
}

}

int main()
{
    try
    {
        test_responses_routed_by_request_id();
        test_clean_drain_completes();
        test_read_failure_dominates();
        test_truncated_frames();
        test_malformed_frames();
        test_cancel_fails_waiters();
        test_response_table_holds_early_responses();
        test_response_table_drops_unclaimed_responses();
        test_session_drops_unsolicited_responses();
    }
    catch(const std::exception & e)
    {
        std::cerr << "[FAIL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
