/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"
#include "utils/precompiled.hpp"

#include "protocol/frame_decoder.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/wire.hpp"

#include <unity.h>
#include <string.h>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

//  Drains the encoder into a byte string using its own buffer.
static std::string encode_all (zxfer::frame_encoder_t &encoder_)
{
    std::string out;
    while (true) {
        unsigned char *data = NULL;
        const size_t size = encoder_.encode (&data, 0);
        if (size == 0)
            break;
        out.append (reinterpret_cast<const char *> (data), size);
    }
    return out;
}

static const unsigned char *bytes (const std::string &s_)
{
    return reinterpret_cast<const unsigned char *> (s_.data ());
}

void test_encode_known_bytes ()
{
    zxfer::frame_encoder_t encoder (64);
    const zxfer::frame_t frame ("a.bin", 5);
    encoder.load_frame (&frame);

    const unsigned char expected[] = {0,   0,   0,   5, 'a', '.', 'b', 'i', 'n',
                                      0,   0,   0,   0, 0,   0,   0,   5};
    const std::string encoded = encode_all (encoder);
    TEST_ASSERT_EQUAL_INT (sizeof (expected), encoded.size ());
    TEST_ASSERT_EQUAL_MEMORY (expected, encoded.data (), sizeof (expected));
}

void test_encode_large_size_is_big_endian ()
{
    zxfer::frame_encoder_t encoder (64);
    const zxfer::frame_t frame ("x", 0x0102030405060708ULL);
    encoder.load_frame (&frame);

    const std::string encoded = encode_all (encoder);
    TEST_ASSERT_EQUAL_INT (4 + 1 + 8, encoded.size ());
    const unsigned char size[] = {1, 2, 3, 4, 5, 6, 7, 8};
    TEST_ASSERT_EQUAL_MEMORY (size, encoded.data () + 5, 8);
}

void test_encode_through_small_buffer ()
{
    //  Every field is at least as large as the buffer, so each batch is
    //  handed out without copying.
    zxfer::frame_encoder_t encoder (4);
    const zxfer::frame_t frame ("long-file-name.dat", 42);
    encoder.load_frame (&frame);

    std::vector<size_t> batches;
    std::string encoded;
    while (true) {
        unsigned char *data = NULL;
        const size_t size = encoder.encode (&data, 0);
        if (size == 0)
            break;
        batches.push_back (size);
        encoded.append (reinterpret_cast<const char *> (data), size);
    }

    TEST_ASSERT_EQUAL_INT (3, batches.size ());
    TEST_ASSERT_EQUAL_INT (4, batches[0]);
    TEST_ASSERT_EQUAL_INT (frame.name.size (), batches[1]);
    TEST_ASSERT_EQUAL_INT (8, batches[2]);
    TEST_ASSERT_TRUE (make_frame (frame.name, 42) == encoded);
}

void test_encode_into_caller_buffer ()
{
    zxfer::frame_encoder_t encoder (64);
    const zxfer::frame_t frame ("b.txt", 3);
    encoder.load_frame (&frame);

    unsigned char buf[5];
    std::string encoded;
    while (true) {
        unsigned char *data = buf;
        const size_t size = encoder.encode (&data, sizeof (buf));
        if (size == 0)
            break;
        TEST_ASSERT_EQUAL_PTR (buf, data);
        encoded.append (reinterpret_cast<const char *> (data), size);
    }
    TEST_ASSERT_TRUE (make_frame ("b.txt", 3) == encoded);
}

void test_encoder_is_reusable ()
{
    zxfer::frame_encoder_t encoder (64);
    const zxfer::frame_t first ("one", 1);
    const zxfer::frame_t second ("two", 2);

    encoder.load_frame (&first);
    TEST_ASSERT_TRUE (make_frame ("one", 1) == encode_all (encoder));
    encoder.load_frame (&second);
    TEST_ASSERT_TRUE (make_frame ("two", 2) == encode_all (encoder));
}

void test_decode_single_frame ()
{
    zxfer::frame_decoder_t decoder (255, UINT64_MAX);
    const std::string wire = make_frame ("a.bin", 5);

    size_t used = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (bytes (wire), wire.size (), used));
    TEST_ASSERT_EQUAL_INT (wire.size (), used);
    TEST_ASSERT_EQUAL_STRING ("a.bin", decoder.frame ()->name.c_str ());
    TEST_ASSERT_EQUAL_UINT64 (5, decoder.frame ()->size);
    TEST_ASSERT_FALSE (decoder.in_frame ());
}

void test_decode_stops_at_frame_end ()
{
    zxfer::frame_decoder_t decoder (255, UINT64_MAX);
    const std::string wire = make_frame ("a", 3) + "xyz" + make_frame ("b", 0);

    size_t used = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (bytes (wire), wire.size (), used));
    TEST_ASSERT_EQUAL_INT (4 + 1 + 8, used);

    //  The caller consumes the payload; the next frame follows.
    const size_t next = used + 3;
    TEST_ASSERT_EQUAL_INT (
      1, decoder.decode (bytes (wire) + next, wire.size () - next, used));
    TEST_ASSERT_EQUAL_STRING ("b", decoder.frame ()->name.c_str ());
    TEST_ASSERT_EQUAL_UINT64 (0, decoder.frame ()->size);
}

void test_decode_byte_at_a_time ()
{
    zxfer::frame_decoder_t decoder (255, UINT64_MAX);
    const std::string wire = make_frame ("split.txt", 1234);

    for (size_t i = 0; i + 1 < wire.size (); i++) {
        size_t used = 0;
        TEST_ASSERT_EQUAL_INT (0, decoder.decode (bytes (wire) + i, 1, used));
        TEST_ASSERT_EQUAL_INT (1, used);
        TEST_ASSERT_TRUE (decoder.in_frame ());
    }
    size_t used = 0;
    TEST_ASSERT_EQUAL_INT (
      1, decoder.decode (bytes (wire) + wire.size () - 1, 1, used));
    TEST_ASSERT_EQUAL_STRING ("split.txt", decoder.frame ()->name.c_str ());
    TEST_ASSERT_EQUAL_UINT64 (1234, decoder.frame ()->size);
    TEST_ASSERT_FALSE (decoder.in_frame ());
}

void test_decode_nothing_is_not_in_frame ()
{
    zxfer::frame_decoder_t decoder (255, UINT64_MAX);
    size_t used = 7;
    TEST_ASSERT_EQUAL_INT (0, decoder.decode (NULL, 0, used));
    TEST_ASSERT_EQUAL_INT (0, used);
    TEST_ASSERT_FALSE (decoder.in_frame ());
}

void test_decode_zero_length_name ()
{
    //  Legal on the wire; rejecting it is up to the receiver.
    zxfer::frame_decoder_t decoder (255, UINT64_MAX);
    const std::string wire = make_frame ("", 9);

    size_t used = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (bytes (wire), wire.size (), used));
    TEST_ASSERT_TRUE (decoder.frame ()->name.empty ());
    TEST_ASSERT_EQUAL_UINT64 (9, decoder.frame ()->size);
}

void test_decode_name_with_binary_bytes ()
{
    zxfer::frame_decoder_t decoder (255, UINT64_MAX);
    const std::string name ("a\0b", 3);
    const std::string wire = make_frame (name, 1);

    size_t used = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (bytes (wire), wire.size (), used));
    TEST_ASSERT_TRUE (decoder.frame ()->name == name);
}

void test_decode_name_at_limit ()
{
    zxfer::frame_decoder_t decoder (8, UINT64_MAX);
    const std::string wire = make_frame ("12345678", 1);

    size_t used = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (bytes (wire), wire.size (), used));
    TEST_ASSERT_EQUAL_STRING ("12345678", decoder.frame ()->name.c_str ());
}

void test_decode_name_over_limit ()
{
    zxfer::frame_decoder_t decoder (8, UINT64_MAX);
    const std::string wire = make_frame ("123456789", 1);

    //  The violation is detected from the length field alone.
    size_t used = 0;
    errno = 0;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (bytes (wire), 4, used));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
}

void test_decode_size_over_limit ()
{
    zxfer::frame_decoder_t decoder (255, 100);
    const std::string ok = make_frame ("a", 100);
    const std::string too_big = make_frame ("b", 101);

    size_t used = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (bytes (ok), ok.size (), used));
    errno = 0;
    TEST_ASSERT_EQUAL_INT (-1,
                           decoder.decode (bytes (too_big), too_big.size (), used));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
}

void test_decode_size_beyond_wire_maximum ()
{
    //  Even an unlimited decoder refuses sizes with the top bit set.
    zxfer::frame_decoder_t decoder (255, UINT64_MAX);
    const std::string max_ok = make_frame ("a", zxfer::frame_max_file_size);
    const std::string too_big =
      make_frame ("b", zxfer::frame_max_file_size + 1);

    size_t used = 0;
    TEST_ASSERT_EQUAL_INT (1,
                           decoder.decode (bytes (max_ok), max_ok.size (), used));
    TEST_ASSERT_EQUAL_UINT64 (zxfer::frame_max_file_size,
                              decoder.frame ()->size);
    errno = 0;
    TEST_ASSERT_EQUAL_INT (-1,
                           decoder.decode (bytes (too_big), too_big.size (), used));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
}

void test_roundtrip_bounds ()
{
    const size_t name_lens[] = {0, 1, 65535};
    const uint64_t sizes[] = {0, zxfer::frame_max_file_size};

    for (size_t i = 0; i < sizeof (name_lens) / sizeof (name_lens[0]); i++) {
        for (size_t j = 0; j < sizeof (sizes) / sizeof (sizes[0]); j++) {
            std::string name (name_lens[i], '\0');
            for (size_t k = 0; k < name.size (); k++)
                name[k] = static_cast<char> ('a' + k % 26);

            zxfer::frame_encoder_t encoder (4096);
            const zxfer::frame_t frame (name, sizes[j]);
            encoder.load_frame (&frame);
            const std::string wire = encode_all (encoder);
            TEST_ASSERT_EQUAL_INT (zxfer::frame_header_size (name.size ()),
                                   wire.size ());

            zxfer::frame_decoder_t decoder (65535, UINT64_MAX);
            size_t used = 0;
            TEST_ASSERT_EQUAL_INT (
              1, decoder.decode (bytes (wire), wire.size (), used));
            TEST_ASSERT_EQUAL_INT (wire.size (), used);
            TEST_ASSERT_EQUAL_INT (name.size (),
                                   decoder.frame ()->name.size ());
            TEST_ASSERT_TRUE (decoder.frame ()->name == name);
            TEST_ASSERT_EQUAL_UINT64 (sizes[j], decoder.frame ()->size);
            TEST_ASSERT_FALSE (decoder.in_frame ());
        }
    }
}

void test_wire_helpers ()
{
    unsigned char buf[8];
    zxfer::put_uint32 (buf, 0x01020304);
    TEST_ASSERT_EQUAL_UINT8 (1, buf[0]);
    TEST_ASSERT_EQUAL_UINT8 (4, buf[3]);
    TEST_ASSERT_EQUAL_UINT32 (0x01020304, zxfer::get_uint32 (buf));

    zxfer::put_uint64 (buf, 0x1122334455667788ULL);
    TEST_ASSERT_EQUAL_UINT8 (0x11, buf[0]);
    TEST_ASSERT_EQUAL_UINT8 (0x88, buf[7]);
    TEST_ASSERT_EQUAL_UINT64 (0x1122334455667788ULL, zxfer::get_uint64 (buf));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_encode_known_bytes);
    RUN_TEST (test_encode_large_size_is_big_endian);
    RUN_TEST (test_encode_through_small_buffer);
    RUN_TEST (test_encode_into_caller_buffer);
    RUN_TEST (test_encoder_is_reusable);
    RUN_TEST (test_decode_single_frame);
    RUN_TEST (test_decode_stops_at_frame_end);
    RUN_TEST (test_decode_byte_at_a_time);
    RUN_TEST (test_decode_nothing_is_not_in_frame);
    RUN_TEST (test_decode_zero_length_name);
    RUN_TEST (test_decode_name_with_binary_bytes);
    RUN_TEST (test_decode_name_at_limit);
    RUN_TEST (test_decode_name_over_limit);
    RUN_TEST (test_decode_size_over_limit);
    RUN_TEST (test_decode_size_beyond_wire_maximum);
    RUN_TEST (test_roundtrip_bounds);
    RUN_TEST (test_wire_helpers);
    return UNITY_END ();
}
