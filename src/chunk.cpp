////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/gelf/chunk.hpp"
#include <pfs/fmt.hpp>
#include <pfs/i18n.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <chrono>
#include <random>

GELF__NAMESPACE_BEGIN

chunk_group_id generate_group_id ()
{
    thread_local std::mt19937 rng {std::random_device{}()};
    std::uniform_int_distribution<int> dist {0, 10000};

    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();

    auto token = fmt::format("{}.{:06}{}", micros / 1000000, micros % 1000000, dist(rng));

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_size = 0;

    auto success = EVP_Digest(token.data(), token.size(), digest, & digest_size
        , EVP_md5(), nullptr);

    if (success != 1 || digest_size < std::tuple_size<chunk_group_id>::value) {
        throw error {
              make_error_code(errc::framing_error)
            , tr::_("generate chunk group identifier failure")
        };
    }

    chunk_group_id result;
    std::copy(digest, digest + result.size(), result.begin());
    return result;
}

std::vector<chunk> frame (std::vector<char> const & payload, int chunk_size
    , chunk_group_id const & group_id, bool split_small_payload)
{
    if (chunk_size <= 0) {
        throw error {
              make_error_code(errc::framing_error)
            , tr::f_("chunk size must be greater than 0, got: {}", chunk_size)
        };
    }

    if (payload.empty()) {
        throw error {
              make_error_code(errc::framing_error)
            , tr::_("chunk data must not be empty")
        };
    }

    auto total = payload.size();
    auto limit = static_cast<std::size_t>(chunk_size);
    std::vector<std::size_t> sizes;

    if (total > limit) {
        auto count = (total + limit - 1) / limit;

        if (count > MAX_CHUNK_COUNT) {
            throw error {
                  make_error_code(errc::framing_error)
                , tr::f_("too many chunks: {}, maximum is {} (payload size: {}, chunk size: {})"
                    , count, MAX_CHUNK_COUNT, total, limit)
            };
        }

        sizes.assign(count, limit);
        sizes.back() = total - limit * (count - 1);
    } else if (split_small_payload) {
        auto half = total / 2;

        if (half == 0) {
            throw error {
                  make_error_code(errc::framing_error)
                , tr::f_("payload too small to be split in two: {} byte(s)", total)
            };
        }

        sizes.push_back(half);
        sizes.push_back(total - half);
    } else {
        sizes.push_back(total);
    }

    std::vector<chunk> result;
    result.reserve(sizes.size());

    auto count = static_cast<std::uint8_t>(sizes.size());
    char const * pos = payload.data();

    for (std::size_t i = 0; i < sizes.size(); i++) {
        result.push_back(chunk{group_id, static_cast<std::uint8_t>(i), count, pos, sizes[i]});
        pos += sizes[i];
    }

    return result;
}

std::vector<char> serialize (chunk const & c)
{
    std::vector<char> out;
    out.reserve(CHUNK_HEADER_SIZE + c.size);

    out.push_back(static_cast<char>(CHUNK_MAGIC_0));
    out.push_back(static_cast<char>(CHUNK_MAGIC_1));
    out.insert(out.end(), c.group_id.begin(), c.group_id.end());
    out.push_back(static_cast<char>(c.sequence_index));
    out.push_back(static_cast<char>(c.sequence_count));
    out.insert(out.end(), c.data, c.data + c.size);

    return out;
}

std::string to_string (chunk_group_id const & group_id)
{
    std::string result;
    result.reserve(group_id.size() * 2);

    for (auto ch: group_id)
        result += fmt::format("{:02x}", static_cast<unsigned int>(static_cast<std::uint8_t>(ch)));

    return result;
}

GELF__NAMESPACE_END
