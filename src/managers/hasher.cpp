#include "hasher.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <memory>
#include <optional>
#include <thread>

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string to_hex(const unsigned char* data, unsigned int len) {
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out += HEX[data[i] >> 4];
        out += HEX[data[i] & 0x0F];
    }
    return out;
}

} // namespace

Hasher::Hasher(unsigned workers)
    : workers_(workers == 0 ? platform::cpu_count() : workers) {}

ContentHash Hasher::digest(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw PipelineError(ErrorKind::IO, "Cannot read " + path.string());
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw PipelineError(ErrorKind::IO, "SHA-256 context initialisation failed");
    }

    std::vector<char> buf(HASH_READ_BUF_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            throw PipelineError(ErrorKind::IO, "SHA-256 update failed for " + path.string());
        }
    }
    if (in.bad()) {
        throw PipelineError(ErrorKind::IO, "Read error on " + path.string());
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        throw PipelineError(ErrorKind::IO, "SHA-256 finalisation failed for " + path.string());
    }
    return to_hex(out, out_len);
}

std::unordered_map<std::string, ContentHash>
Hasher::digest_batch(const std::vector<fs::path>& paths, HashProgress progress) const {
    // One slot per input: each worker only writes the slots it claimed, so the
    // merge below needs no locking.
    std::vector<std::optional<ContentHash>> slots(paths.size());
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};

    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= paths.size()) return;
            try {
                slots[i] = digest(paths[i]);
            } catch (const std::exception& e) {
                log_warn("hash worker: {}", e.what());
            }
            size_t n = done.fetch_add(1) + 1;
            if (progress) progress(n, paths.size());
        }
    };

    size_t pool_size = std::min<size_t>(workers_, paths.size());
    std::vector<std::thread> pool;
    pool.reserve(pool_size);
    for (size_t t = 0; t < pool_size; t++) {
        pool.emplace_back(worker);
    }
    for (auto& t : pool) t.join();

    std::unordered_map<std::string, ContentHash> result;
    result.reserve(paths.size());
    for (size_t i = 0; i < paths.size(); i++) {
        if (slots[i]) result.emplace(paths[i].string(), std::move(*slots[i]));
    }

    log_debug("hashed {}/{} files with {} workers", result.size(), paths.size(), pool_size);
    return result;
}
