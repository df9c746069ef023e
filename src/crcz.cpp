#include "crcz/crcz.hpp"
#include "crcz/alphabet.hpp"
#include "crcz/errors.hpp"
#include "crcz/framing.hpp"
#include "crcz/grid.hpp"
#include "crcz/reconstruct.hpp"
#include "crcz/util.hpp"

#include <chrono>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace crcz {

namespace {

const char* kVersion = "crcz 1.0.0";

Result failure(ErrorKind kind, const std::string& message) {
    Result r;
    r.success = false;
    r.error = kind;
    r.error_message = message;
    return r;
}

bool read_file(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

bool write_file(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return out.good();
}

// Maps the crcz error taxonomy onto Result; anything unexpected propagates.
template <class Fn>
Result guarded(Fn&& fn) {
    try {
        return fn();
    } catch (const NoCandidateFound& e) {
        Result r = failure(ErrorKind::NO_CANDIDATE, e.what());
        r.failed_block = e.block_index();
        return r;
    } catch (const FormatError& e) {
        return failure(ErrorKind::FORMAT, e.what());
    } catch (const UnsupportedBlockSize& e) {
        return failure(ErrorKind::UNSUPPORTED_BLOCK_SIZE, e.what());
    } catch (const Cancelled& e) {
        return failure(ErrorKind::CANCELLED, e.what());
    } catch (const BackendUnavailable& e) {
        return failure(ErrorKind::BACKEND_UNAVAILABLE, e.what());
    } catch (const std::invalid_argument& e) {
        return failure(ErrorKind::INVALID_ARGUMENT, e.what());
    }
}

} // anonymous namespace

class Compressor::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {
        initialize();
    }

    Result compress(const uint8_t* input, size_t input_size, std::vector<uint8_t>& output) {
        auto start_time = std::chrono::steady_clock::now();
        Result result = guarded([&]() {
            DigestStream s = encode(input, input_size, config_.block_size);
            output = serialize(s);

            Result r;
            r.success = true;
            r.stats.blocks = s.records.size();
            return r;
        });
        finish(result, input_size, result.success ? output.size() : 0, "encoder", start_time);
        return result;
    }

    Result decompress(const uint8_t* input, size_t input_size, std::vector<uint8_t>& output,
                      ProgressCallback progress_callback) {
        auto start_time = std::chrono::steady_clock::now();
        std::string engine_name = config_.engine == EngineKind::BOUNDED ? "bounded" : "parallel";

        Result result = guarded([&]() {
            DigestStream s = deserialize(input, input_size);
            if (config_.block_size != 0 && s.block_size != config_.block_size) {
                throw FormatError("block size mismatch: stream has " + std::to_string(s.block_size) +
                                  ", decoder configured for " + std::to_string(config_.block_size));
            }

            CancelToken* token = begin_operation();
            EngineOptions opts = engine_options(token);
            auto engine = make_engine(opts);
            if (!engine) throw std::invalid_argument("search engine not available");
            engine_name = engine->name();

            const size_t blocks = s.records.size();
            if (progress_callback) {
                engine->set_progress(progress_callback);
            } else if (config_.verbose) {
                const char* name = engine->name();
                engine->set_progress([blocks, name](uint64_t done, uint64_t total) {
                    render_progress_bar(total ? double(done) / double(total) : 1.0, done, total, blocks, name);
                });
            }

            std::vector<uint8_t> payload = reconstruct(s, *engine);
            if (config_.verbose) std::fprintf(stderr, "\n");
            output = std::move(payload);

            Result r;
            r.success = true;
            r.stats.blocks = blocks;
            return r;
        });
        end_operation();
        finish(result, input_size, result.success ? output.size() : 0, engine_name, start_time);
        return result;
    }

    Result compress_file(const std::string& input_file, const std::string& output_file) {
        std::vector<uint8_t> in, out;
        if (!read_file(input_file, in)) return failure(ErrorKind::IO, "cannot read " + input_file);
        Result r = compress(in.data(), in.size(), out);
        if (r && !write_file(output_file, out)) return failure(ErrorKind::IO, "cannot write " + output_file);
        return r;
    }

    Result decompress_file(const std::string& input_file, const std::string& output_file,
                           ProgressCallback progress_callback) {
        std::vector<uint8_t> in, out;
        if (!read_file(input_file, in)) return failure(ErrorKind::IO, "cannot read " + input_file);
        Result r = decompress(in.data(), in.size(), out, std::move(progress_callback));
        if (r && !write_file(output_file, out)) return failure(ErrorKind::IO, "cannot write " + output_file);
        return r;
    }

    void cancel() {
        std::lock_guard<std::mutex> lk(token_mu_);
        if (token_) token_->cancel();
    }

    Config get_config() const { return config_; }

    const Stats& get_last_stats() const { return stats_; }

private:
    Config config_;
    Alphabet alphabet_;
    Stats stats_;

    std::mutex token_mu_;
    std::unique_ptr<CancelToken> token_;

    void initialize() {
        if (config_.block_size > MAX_WIRE_BLOCK_SIZE) {
            throw std::invalid_argument("Invalid block size (must be 0-255)");
        }
        if (config_.engine != EngineKind::BOUNDED && config_.engine != EngineKind::PARALLEL) {
            throw std::invalid_argument("Invalid engine");
        }
        if (config_.backend != Backend::HOST && config_.backend != Backend::CUDA) {
            throw std::invalid_argument("Invalid backend");
        }
        alphabet_ = parse_alphabet(config_.alphabet);
        if (alphabet_.empty()) {
            throw std::invalid_argument("Empty alphabet");
        }
    }

    EngineOptions engine_options(const CancelToken* token) const {
        EngineOptions opts;
        opts.kind = config_.engine;
        opts.alphabet = alphabet_;
        opts.backend = config_.backend;
        opts.gpu_ids = config_.gpu_ids;
        opts.cancel = token;
        opts.verbose = config_.verbose;
        if (config_.engine == EngineKind::PARALLEL) {
            if (config_.backend == Backend::HOST) {
                // AutoTune{} defaults are GPU-sized
                opts.tune = pick_host_tuning(config_.verbose && config_.enable_autotune, config_.host_threads);
            } else {
                opts.tune = config_.enable_autotune ? pick_tuning(config_.backend, config_.verbose) : AutoTune{};
            }
            if (config_.gid_span > 0) opts.tune.gid_span = config_.gid_span;
        }
        return opts;
    }

    CancelToken* begin_operation() {
        std::lock_guard<std::mutex> lk(token_mu_);
        if (config_.timeout_ms > 0) {
            token_ = std::make_unique<CancelToken>(std::chrono::milliseconds(config_.timeout_ms));
        } else {
            token_ = std::make_unique<CancelToken>();
        }
        return token_.get();
    }

    void end_operation() {
        std::lock_guard<std::mutex> lk(token_mu_);
        token_.reset();
    }

    void finish(Result& result, size_t in_bytes, size_t out_bytes, const std::string& engine,
                std::chrono::steady_clock::time_point start_time) {
        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

        result.stats.input_bytes = in_bytes;
        result.stats.output_bytes = out_bytes;
        result.stats.engine = engine;
        result.stats.elapsed_ms = duration.count() / 1000.0;
        if (duration.count() > 0) {
            result.stats.blocks_per_second = result.stats.blocks / (duration.count() / 1000000.0);
        }
        stats_ = result.stats;
    }
};

// Implementation of public API functions

Compressor::Compressor(const Config& config) : impl_(std::make_unique<Impl>(config)) {}
Compressor::~Compressor() = default;

Result Compressor::compress(const uint8_t* input, size_t input_size, std::vector<uint8_t>& output) {
    return impl_->compress(input, input_size, output);
}

Result Compressor::decompress(const uint8_t* input, size_t input_size, std::vector<uint8_t>& output,
                              ProgressCallback progress_callback) {
    return impl_->decompress(input, input_size, output, std::move(progress_callback));
}

Result Compressor::compress_file(const std::string& input_file, const std::string& output_file) {
    return impl_->compress_file(input_file, output_file);
}

Result Compressor::decompress_file(const std::string& input_file, const std::string& output_file,
                                   ProgressCallback progress_callback) {
    return impl_->decompress_file(input_file, output_file, std::move(progress_callback));
}

void Compressor::cancel() {
    impl_->cancel();
}

Config Compressor::get_config() const {
    return impl_->get_config();
}

const Stats& Compressor::get_last_stats() const {
    return impl_->get_last_stats();
}

std::string get_version() {
    return kVersion;
}

bool is_available(Backend backend) {
    if (backend == Backend::HOST) return true;
    return cuda_built() && !discover_gpus_ids().empty();
}

std::vector<int> get_available_gpus() {
    return discover_gpus_ids();
}

Result compress_file(const std::string& input_file, const std::string& output_file,
                     const Config& config) {
    Compressor c(config);
    return c.compress_file(input_file, output_file);
}

Result decompress_file(const std::string& input_file, const std::string& output_file,
                       const Config& config) {
    Compressor c(config);
    return c.decompress_file(input_file, output_file);
}

} // namespace crcz
