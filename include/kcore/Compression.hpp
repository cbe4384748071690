/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_COMPRESSION_HPP
#define KCORE_COMPRESSION_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Exception.hpp>
#include <kcore/Factory.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcore {

/**
 * @brief Compression codecs. The values are those stored in the low
 * bits of the attributes of a record batch.
 */
enum class CompressionType : int8_t {
    None   = 0,
    Gzip   = 1,
    Snappy = 2,
    Lz4    = 3,
    Zstd   = 4
};

/**
 * @brief Name under which the codec is registered ("none", "gzip",
 * "snappy", "lz4", "zstd").
 */
const char* compressionTypeName(CompressionType type);

/**
 * @brief Parses a codec name. Throws an Exception for unknown names.
 */
CompressionType compressionTypeFromName(std::string_view name);

/**
 * @brief A CompressionCodec is a compression type with an optional
 * compression level. A codec without level uses the library's default.
 */
struct CompressionCodec {

    CompressionType    type = CompressionType::None;
    std::optional<int> level;

    static CompressionCodec None()   { return {CompressionType::None, std::nullopt}; }
    static CompressionCodec Gzip()   { return {CompressionType::Gzip, std::nullopt}; }
    static CompressionCodec Snappy() { return {CompressionType::Snappy, std::nullopt}; }
    static CompressionCodec Lz4()    { return {CompressionType::Lz4, std::nullopt}; }
    static CompressionCodec Zstd()   { return {CompressionType::Zstd, std::nullopt}; }

    /**
     * @brief Returns a copy of this codec with the given level.
     */
    CompressionCodec withLevel(int l) const {
        return {type, l};
    }

    /**
     * @brief Throws an Exception if the level is not valid for the codec
     * (gzip: -1 to 9, lz4: 0 to 12, zstd: 1 to 22, none and snappy
     * take no level).
     */
    void validate() const;

    /**
     * @brief Minimum produce request version able to carry this codec.
     */
    int16_t minProduceVersion() const {
        return type == CompressionType::Zstd ? 7 : 0;
    }

    bool operator==(const CompressionCodec& other) const {
        return type == other.type && level == other.level;
    }
    bool operator!=(const CompressionCodec& other) const {
        return !(*this == other);
    }
};

/**
 * @brief The CompressorInterface class is the interface implemented
 * by every codec. Instances are pooled and reused across batches, so an
 * implementation may keep compression contexts between calls, but a
 * single instance is never used by two threads at the same time.
 */
class CompressorInterface {

    public:

    /**
     * @brief Destructor.
     */
    virtual ~CompressorInterface() = default;

    /**
     * @brief Compresses the input, replacing the content of output.
     *
     * @return false if the codec could not produce any output. This is
     * not an error: the caller falls back to the uncompressed input.
     */
    virtual bool compress(std::string_view input, std::vector<char>& output) = 0;

    /**
     * @brief Decompresses the input, replacing the content of output.
     * Throws an Exception if the input is not valid for the codec.
     */
    virtual void decompress(std::string_view input, std::vector<char>& output) = 0;

    /**
     * @note A CompressorInterface class must also provide a static create
     * function with the following prototype:
     *
     * static std::unique_ptr<CompressorInterface> create(const CompressionCodec&);
     */
};

using CompressorFactory = Factory<CompressorInterface, const CompressionCodec&>;

#define KCORE_REGISTER_COMPRESSOR(__name__, __type__) \
    KCORE_REGISTER_IMPLEMENTATION_FOR(CompressorFactory, __type__, __name__)

class CompressorPool;

/**
 * @brief A Compressor is the codec negotiated for a producer, together
 * with a pool of codec instances. Copies of a Compressor share the same
 * pool, and the pool can be used from several threads concurrently.
 *
 * A default-constructed (or negotiated-to-nothing) Compressor is invalid
 * and means that batches are not compressed.
 */
class Compressor {

    public:

    /**
     * @brief Constructor. Builds an invalid Compressor (no compression).
     */
    Compressor();

    /**
     * @brief Constructor from a codec. Throws if the codec is invalid or
     * if no implementation is registered for it. Building a Compressor
     * from CompressionCodec::None() gives an invalid Compressor.
     */
    Compressor(const CompressionCodec& codec);

    /**
     * @brief Copy-constructor.
     */
    Compressor(const Compressor&);

    /**
     * @brief Move-constructor.
     */
    Compressor(Compressor&&);

    /**
     * @brief copy-assignment operator.
     */
    Compressor& operator=(const Compressor&);

    /**
     * @brief Move-assignment operator.
     */
    Compressor& operator=(Compressor&&);

    /**
     * @brief Destructor.
     */
    ~Compressor();

    /**
     * @brief Checks for the validity of the underlying pointer.
     */
    operator bool() const;

    /**
     * @brief Codec used by this Compressor.
     */
    CompressionCodec codec() const;

    /**
     * @brief Bits to OR into the attributes of a batch compressed with
     * this Compressor.
     */
    int16_t attributes() const;

    /**
     * @brief Compresses input into output using a pooled codec instance.
     *
     * @return false if the codec produced no output.
     */
    bool compress(std::string_view input, std::vector<char>& output) const;

    /**
     * @brief Decompresses input into output using a pooled codec instance.
     */
    void decompress(std::string_view input, std::vector<char>& output) const;

    /**
     * @brief Number of idle codec instances currently held by the pool.
     */
    std::size_t pooled() const;

    /**
     * @brief Picks the first codec in order of preference that can be
     * carried by a produce request of the given version. Returns an
     * invalid Compressor if that codec is "none" or if no codec matches.
     *
     * @param preference Codecs in order of preference.
     * @param produceVersion Negotiated produce request version.
     */
    static Compressor Negotiate(const std::vector<CompressionCodec>& preference,
                                int16_t produceVersion);

    private:

    std::shared_ptr<CompressorPool> self;

    Compressor(const std::shared_ptr<CompressorPool>& impl);
};

/**
 * @brief Decompresses a buffer compressed with the given codec type.
 * Convenience wrapper creating a short-lived Compressor.
 */
std::vector<char> decompress(CompressionType type, std::string_view input);

}

#endif
