#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "crcz/autotune.hpp"
#include "crcz/search.hpp"

namespace crcz {

/**
 * @brief Configuration for crcz compression/decompression
 */
struct Config {
    unsigned block_size = 2;             // Block size N; 0 on decompress = take it from the stream
    EngineKind engine = EngineKind::PARALLEL;
    std::string alphabet = "printable";  // Bounded engine alphabet spec (see parse_alphabet)
    Backend backend = Backend::HOST;     // Parallel engine execution backend
    std::vector<int> gpu_ids;            // GPU IDs to use (empty = all available)
    unsigned host_threads = 0;           // Host backend worker threads (0 = all cores)
    uint64_t gid_span = 0;               // Candidates per grid launch (0 = tuning default)
    bool enable_autotune = false;        // Derive launch geometry from the device
    uint32_t timeout_ms = 0;             // Abort a search after this long (0 = never)
    bool verbose = false;                // Diagnostics and progress bar on stderr
};

/**
 * @brief Error categories reported through Result
 */
enum class ErrorKind {
    NONE = 0,
    FORMAT,
    NO_CANDIDATE,
    UNSUPPORTED_BLOCK_SIZE,
    CANCELLED,
    BACKEND_UNAVAILABLE,
    INVALID_ARGUMENT,
    IO
};

/**
 * @brief Statistics of the last operation
 */
struct Stats {
    size_t input_bytes = 0;
    size_t output_bytes = 0;
    size_t blocks = 0;
    double elapsed_ms = 0.0;
    double blocks_per_second = 0.0;
    std::string engine;
};

/**
 * @brief Result of compression/decompression operations
 */
struct Result {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string error_message;
    size_t failed_block = 0;   // Valid when error == NO_CANDIDATE
    Stats stats;

    explicit operator bool() const { return success; }
};

/**
 * @brief Digest-stream encoder and brute-force decoder
 *
 * Compression is cheap and always runs on the host. Decompression searches
 * every block's candidate space and can take a very long time; see
 * BoundedSearch and ParallelSearch for the cost of each engine.
 */
class Compressor {
public:
    /**
     * @brief Create a new compressor instance
     * @param config Configuration; throws std::invalid_argument when it is unusable
     */
    explicit Compressor(const Config& config = Config());

    ~Compressor();

    /**
     * @brief Encode a payload into a serialized digest stream
     * @param input Payload bytes
     * @param input_size Payload size
     * @param output Receives the serialized stream
     * @return Result indicating success/failure and statistics
     */
    Result compress(const uint8_t* input, size_t input_size, std::vector<uint8_t>& output);

    /**
     * @brief Reconstruct a payload from a serialized digest stream
     * @param input Serialized digest stream
     * @param input_size Size of the stream
     * @param output Receives the recovered payload (untouched on failure)
     * @param progress_callback Optional progress reporting function
     * @return Result indicating success/failure and statistics
     */
    Result decompress(const uint8_t* input, size_t input_size, std::vector<uint8_t>& output,
                      ProgressCallback progress_callback = nullptr);

    /**
     * @brief Compress a file
     * @param input_file Path to payload file
     * @param output_file Path to digest stream file
     * @return Result indicating success/failure and statistics
     */
    Result compress_file(const std::string& input_file, const std::string& output_file);

    /**
     * @brief Decompress a file
     * @param input_file Path to digest stream file
     * @param output_file Path to recovered payload file
     * @param progress_callback Optional progress reporting function
     * @return Result indicating success/failure and statistics
     */
    Result decompress_file(const std::string& input_file, const std::string& output_file,
                           ProgressCallback progress_callback = nullptr);

    /**
     * @brief Ask a running decompress() on another thread to stop
     *
     * The bounded engine stops between candidates, the parallel engine after
     * the current grid launch retires. The operation then fails with CANCELLED.
     */
    void cancel();

    Config get_config() const;

    const Stats& get_last_stats() const;

    Compressor(const Compressor&) = delete;
    Compressor& operator=(const Compressor&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Get version information
 */
std::string get_version();

/**
 * @brief Check whether a backend can run on this machine
 */
bool is_available(Backend backend);

/**
 * @brief GPU IDs usable by the CUDA backend (empty without CUDA)
 */
std::vector<int> get_available_gpus();

/**
 * @brief Convenience function for file compression
 */
Result compress_file(const std::string& input_file, const std::string& output_file,
                     const Config& config = Config());

/**
 * @brief Convenience function for file decompression
 */
Result decompress_file(const std::string& input_file, const std::string& output_file,
                       const Config& config = Config());

} // namespace crcz
