/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_COMPRESSOR_POOL_HPP
#define KCORE_COMPRESSOR_POOL_HPP

#include "kcore/Compression.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace kcore {

/**
 * @brief Free list of codec instances for one CompressionCodec.
 * Instances are created on demand and returned to the list after use.
 */
class CompressorPool {

    public:

    using Instance = std::unique_ptr<CompressorInterface>;

    /**
     * @brief RAII handle on a checked-out instance. The instance goes back
     * to the pool when the handle is destroyed.
     */
    class Lease {

        public:

        Lease(CompressorPool& pool, Instance instance)
        : m_pool(pool)
        , m_instance(std::move(instance)) {}

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() {
            m_pool.release(std::move(m_instance));
        }

        CompressorInterface* operator->() const {
            return m_instance.get();
        }

        private:

        CompressorPool& m_pool;
        Instance        m_instance;
    };

    CompressorPool(const CompressionCodec& codec)
    : m_codec(codec) {
        // create a first instance so that an unregistered codec fails here
        m_free.push_back(create());
    }

    const CompressionCodec& codec() const {
        return m_codec;
    }

    Lease acquire() {
        {
            std::unique_lock<std::mutex> guard{m_mtx};
            if(!m_free.empty()) {
                auto instance = std::move(m_free.back());
                m_free.pop_back();
                return Lease{*this, std::move(instance)};
            }
        }
        return Lease{*this, create()};
    }

    std::size_t size() const {
        std::unique_lock<std::mutex> guard{m_mtx};
        return m_free.size();
    }

    private:

    Instance create() const {
        return CompressorFactory::create(compressionTypeName(m_codec.type), m_codec);
    }

    void release(Instance instance) {
        if(!instance) return;
        std::unique_lock<std::mutex> guard{m_mtx};
        m_free.push_back(std::move(instance));
    }

    CompressionCodec      m_codec;
    mutable std::mutex    m_mtx;
    std::vector<Instance> m_free;
};

}

#endif
