#include "testutil.hpp"

#include "tpack/channel.hpp"
#include "tpack/error.hpp"
#include "tpack/package.hpp"
#include "tpack/processor.hpp"
#include "tpack/wire.hpp"

#include <unity.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace tpack;

static std::unique_ptr<LocalGroup> group;
static const int stream_length = 50;

void setUp ()
{
    group.reset (new LocalGroup (3));
}

void tearDown ()
{
    group->close ();
    group.reset ();
}

static void send_raw_header (IChannel &ch_, const Tensor &fields_, int dst_)
{
    const Bytes b = encode_f32 (fields_.data (), fields_.size ());
    ch_.send (b.data (), b.size (), dst_);
}

static void send_raw_i32 (IChannel &ch_, const std::vector<int32_t> &v_, int dst_)
{
    const Bytes b = encode_i32 (v_.data (), v_.size ());
    ch_.send (b.data (), b.size (), dst_);
}

static void send_raw_f32 (IChannel &ch_, const Tensor &v_, int dst_)
{
    const Bytes b = encode_f32 (v_.data (), v_.size ());
    ch_.send (b.data (), b.size (), dst_);
}

void test_send_and_receive_tensor_list ()
{
    LocalChannel &a = group->endpoint (0);
    LocalChannel &b = group->endpoint (1);

    Package p = Package::build ({{1, 2, 3}, {4, 5}}, a.rank (), 7);
    PackageProcessor::send_package (a, p, b.rank ());
    TEST_ASSERT_EQUAL_INT (1, p.header ().receiver_rank);
    TEST_ASSERT_EQUAL_UINT (3, group->sent_count (0));

    const Received r = PackageProcessor::recv_package (b, a.rank ());
    TEST_ASSERT_EQUAL_INT (0, r.sender_rank);
    TEST_ASSERT_EQUAL_INT (7, r.message_code);
    TEST_ASSERT_TRUE (r.content.has_value ());
    assert_tensors_equal ({{1, 2, 3}, {4, 5}}, *r.content);
}

void test_header_only_package ()
{
    LocalChannel &a = group->endpoint (0);
    LocalChannel &b = group->endpoint (1);

    Package p = Package::build (TensorList (), a.rank (), 99);
    PackageProcessor::send_package (a, p, b.rank ());
    TEST_ASSERT_EQUAL_UINT (1, group->sent_count (0));

    // A full package right behind it must not be consumed by the first receive
    Package next = Package::build ({{8}}, a.rank (), 1);
    PackageProcessor::send_package (a, next, b.rank ());

    const Received r = PackageProcessor::recv_package (b);
    TEST_ASSERT_EQUAL_INT (0, r.sender_rank);
    TEST_ASSERT_EQUAL_INT (99, r.message_code);
    TEST_ASSERT_FALSE (r.content.has_value ());

    const Received r2 = PackageProcessor::recv_package (b);
    TEST_ASSERT_EQUAL_INT (1, r2.message_code);
    assert_tensors_equal ({{8}}, *r2.content);
}

void test_back_to_back_packages_keep_order ()
{
    LocalChannel &a = group->endpoint (0);
    LocalChannel &b = group->endpoint (1);

    Package first = Package::build ({{1}}, 0, 1);
    Package second = Package::build ({{2, 2}}, 0, 2);
    PackageProcessor::send_package (a, first, 1);
    PackageProcessor::send_package (a, second, 1);

    const Received r1 = PackageProcessor::recv_package (b, 0);
    const Received r2 = PackageProcessor::recv_package (b, 0);
    TEST_ASSERT_EQUAL_INT (1, r1.message_code);
    TEST_ASSERT_EQUAL_INT (2, r2.message_code);
    assert_tensors_equal ({{1}}, *r1.content);
    assert_tensors_equal ({{2, 2}}, *r2.content);
}

void test_recv_into_keeps_header_and_sum ()
{
    LocalChannel &a = group->endpoint (2);
    LocalChannel &b = group->endpoint (0);

    Package p = Package::build ({{1, 2}, {3}, {4, 5, 6, 7}},
                                2, (int) MessageCode::ParameterUpdate);
    PackageProcessor::send_package (a, p, 0);

    const Package q = PackageProcessor::recv_package_into (b);
    TEST_ASSERT_EQUAL_INT (2, q.header ().sender_rank);
    TEST_ASSERT_EQUAL_INT (0, q.header ().receiver_rank);
    TEST_ASSERT_EQUAL_INT (3, q.header ().boundary_count);
    TEST_ASSERT_EQUAL_INT ((int) MessageCode::ParameterUpdate,
                           q.header ().message_code);

    size_t sum = 0;
    for (int32_t n : q.boundaries ())
        sum += (size_t) n;
    TEST_ASSERT_EQUAL_UINT (q.payload ().size (), sum);
    assert_tensor_equal (p.payload (), q.payload ());
}

void test_wildcard_receive_pins_body_to_header_sender ()
{
    LocalChannel &recv = group->endpoint (0);
    LocalChannel &one = group->endpoint (1);
    LocalChannel &two = group->endpoint (2);

    // Rank 1's header arrives first, rank 2's complete package lands before
    // rank 1's body.
    send_raw_header (one, {1, 0, 1, 11}, 0);
    Package p2 = Package::build ({{9, 9, 9}}, 2, 22);
    PackageProcessor::send_package (two, p2, 0);
    send_raw_i32 (one, {2}, 0);
    send_raw_f32 (one, {5, 6}, 0);

    const Received r1 = PackageProcessor::recv_package (recv, kAnySource);
    TEST_ASSERT_EQUAL_INT (1, r1.sender_rank);
    TEST_ASSERT_EQUAL_INT (11, r1.message_code);
    assert_tensors_equal ({{5, 6}}, *r1.content);

    const Received r2 = PackageProcessor::recv_package (recv, kAnySource);
    TEST_ASSERT_EQUAL_INT (2, r2.sender_rank);
    TEST_ASSERT_EQUAL_INT (22, r2.message_code);
    assert_tensors_equal ({{9, 9, 9}}, *r2.content);
}

void test_negative_sender_header_leaves_other_peers_intact ()
{
    LocalChannel &recv = group->endpoint (0);
    LocalChannel &one = group->endpoint (1);
    LocalChannel &two = group->endpoint (2);

    Package p2 = Package::build ({{9, 8, 7}}, 2, 22);
    PackageProcessor::send_package (two, p2, 0);

    // A header naming no sender must not pull its body from the wildcard
    send_raw_header (one, {(float) kUnsetRank, 0, 1, 11}, 0);
    send_raw_i32 (one, {2}, 0);
    send_raw_f32 (one, {5, 6}, 0);

    TEST_ASSERT_TRUE (throws<MalformedHeader> (
      [&] { PackageProcessor::recv_package (recv, 1); }));

    const Received r2 = PackageProcessor::recv_package (recv, 2);
    TEST_ASSERT_EQUAL_INT (2, r2.sender_rank);
    TEST_ASSERT_EQUAL_INT (22, r2.message_code);
    assert_tensors_equal ({{9, 8, 7}}, *r2.content);
}

void test_negative_sender_is_never_sent ()
{
    TEST_ASSERT_TRUE (throws<InvalidInput> ([] {
        Package p = Package::build ({{5, 6}}, kUnsetRank, 1);
        PackageProcessor::send_package (group->endpoint (1), p, 0);
    }));
    TEST_ASSERT_EQUAL_UINT (0, group->sent_count (1));
}

void test_threaded_stream_of_packages ()
{
    std::thread sender ([] {
        LocalChannel &a = group->endpoint (1);
        for (int i = 0; i < stream_length; ++i) {
            TensorList buffers;
            for (int j = 0; j < i % 4; ++j)
                buffers.push_back (Tensor ((size_t) (j + i + 1), (float) i));
            Package p = Package::build (buffers, a.rank (), i);
            PackageProcessor::send_package (a, p, 2);
        }
    });

    LocalChannel &b = group->endpoint (2);
    for (int i = 0; i < stream_length; ++i) {
        const Received r = PackageProcessor::recv_package (b, 1);
        TEST_ASSERT_EQUAL_INT (i, r.message_code);
        if (i % 4 == 0) {
            TEST_ASSERT_FALSE (r.content.has_value ());
            continue;
        }
        TEST_ASSERT_EQUAL_UINT ((size_t) (i % 4), r.content->size ());
        for (size_t j = 0; j < r.content->size (); ++j) {
            TEST_ASSERT_EQUAL_UINT (j + (size_t) i + 1, (*r.content)[j].size ());
            TEST_ASSERT_EQUAL_FLOAT ((float) i, (*r.content)[j][0]);
        }
    }
    sender.join ();
}

void test_malformed_header_aborts_receive ()
{
    LocalChannel &a = group->endpoint (0);
    LocalChannel &b = group->endpoint (1);

    send_raw_header (a, {0, 1, 1.5f, 3}, 1);
    TEST_ASSERT_TRUE (throws<MalformedHeader> (
      [&] { PackageProcessor::recv_package (b, 0); }));
}

void test_short_header_is_channel_failure ()
{
    LocalChannel &a = group->endpoint (0);
    LocalChannel &b = group->endpoint (1);

    send_raw_header (a, {0, 1, 0}, 1);
    TEST_ASSERT_TRUE (throws<ChannelFailure> (
      [&] { PackageProcessor::recv_package (b, 0); }));
}

void test_bad_boundary_table_is_length_mismatch ()
{
    LocalChannel &a = group->endpoint (0);
    LocalChannel &b = group->endpoint (1);

    send_raw_header (a, {0, 1, 2, 3}, 1);
    send_raw_i32 (a, {3, -1}, 1);
    TEST_ASSERT_TRUE (throws<LengthMismatch> (
      [&] { PackageProcessor::recv_package (b, 0); }));
}

void test_send_to_bad_destination ()
{
    LocalChannel &a = group->endpoint (0);
    Package p = Package::build ({{1}}, 0, 0);

    TEST_ASSERT_TRUE (throws<InvalidInput> (
      [&] { PackageProcessor::send_package (a, p, -1); }));
    TEST_ASSERT_TRUE (throws<ChannelFailure> (
      [&] { PackageProcessor::send_package (a, p, 7); }));
}

void test_close_wakes_blocked_receiver ()
{
    std::atomic<bool> failed (false);
    std::thread receiver ([&] {
        try {
            PackageProcessor::recv_package (group->endpoint (1));
        }
        catch (const ChannelFailure &) {
            failed = true;
        }
    });

    std::this_thread::sleep_for (std::chrono::milliseconds (50));
    group->close ();
    receiver.join ();
    TEST_ASSERT_TRUE (failed.load ());

    Package p = Package::build (TensorList (), 0, 0);
    TEST_ASSERT_TRUE (throws<ChannelFailure> (
      [&] { PackageProcessor::send_package (group->endpoint (0), p, 1); }));
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_send_and_receive_tensor_list);
    RUN_TEST (test_header_only_package);
    RUN_TEST (test_back_to_back_packages_keep_order);
    RUN_TEST (test_recv_into_keeps_header_and_sum);
    RUN_TEST (test_wildcard_receive_pins_body_to_header_sender);
    RUN_TEST (test_negative_sender_header_leaves_other_peers_intact);
    RUN_TEST (test_negative_sender_is_never_sent);
    RUN_TEST (test_threaded_stream_of_packages);
    RUN_TEST (test_malformed_header_aborts_receive);
    RUN_TEST (test_short_header_is_channel_failure);
    RUN_TEST (test_bad_boundary_table_is_length_mismatch);
    RUN_TEST (test_send_to_bad_destination);
    RUN_TEST (test_close_wakes_blocked_receiver);
    return UNITY_END ();
}
