/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_PARTITIONER_HPP
#define KCORE_PARTITIONER_HPP

#include <kcore/ForwardDcl.hpp>
#include <kcore/Record.hpp>
#include <kcore/Exception.hpp>
#include <kcore/Factory.hpp>

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace kcore {

/**
 * @brief The PartitionBackups object is handed to backup-aware
 * partitioners. Each call to next() returns the next partition index,
 * in order, with the number of records currently buffered for it.
 *
 * next() may be called at most once per partition during one decision;
 * calling it more often throws an Exception, since it can only be the
 * consequence of a bug in the partitioner.
 */
class PartitionBackups {

    public:

    using BufferedFn = std::function<int64_t(int32_t)>;

    PartitionBackups(int32_t n, BufferedFn buffered)
    : m_n(n)
    , m_buffered(std::move(buffered)) {}

    std::pair<int32_t, int64_t> next();

    private:

    int32_t    m_n;
    int32_t    m_on = 0;
    BufferedFn m_buffered;
};

/**
 * @brief The TopicPartitioner class chooses the partition of each record
 * produced to a given topic. A TopicPartitioner is only ever used by one
 * thread at a time, so implementations do not need to synchronize.
 */
class TopicPartitioner {

    public:

    /**
     * @brief Destructor.
     */
    virtual ~TopicPartitioner() = default;

    /**
     * @brief Called when producing a record would start a new batch on the
     * partition that the record was assigned to.
     */
    virtual void onNewBatch() = 0;

    /**
     * @brief Whether the record must go to the partition computed for it
     * even if that partition is currently not writable.
     */
    virtual bool requiresConsistency(const Record& record) const = 0;

    /**
     * @brief Returns the index, between 0 and n-1, of the partition that
     * should receive the record.
     *
     * @param record Record to partition.
     * @param n Number of partitions of the topic.
     */
    virtual int32_t partition(const Record& record, int32_t n) = 0;
};

/**
 * @brief Optional extension of the TopicPartitioner that partitions based
 * on the number of records buffered per partition. If a TopicPartitioner
 * implements this interface, partition() is never called by selectPartition().
 */
class TopicBackupPartitioner : public TopicPartitioner {

    public:

    virtual int32_t partitionByBackup(const Record& record, int32_t n,
                                      PartitionBackups& backups) = 0;
};

/**
 * @brief The PartitionerInterface class creates the TopicPartitioner of
 * each topic. forTopic() is called once per topic and the resulting
 * object is kept for the lifetime of the topic.
 */
class PartitionerInterface {

    public:

    /**
     * @brief Destructor.
     */
    virtual ~PartitionerInterface() = default;

    virtual std::unique_ptr<TopicPartitioner> forTopic(std::string_view topic) = 0;

    /**
     * @brief Configuration of the partitioner, as accepted by
     * Partitioner::FromConfig.
     */
    virtual nlohmann::json config() const = 0;

    /**
     * @note A PartitionerInterface class that can be created from a
     * configuration must also provide a static create function with the
     * following prototype:
     *
     * static std::unique_ptr<PartitionerInterface> create(const nlohmann::json&);
     */
};

/**
 * @brief Function returning the partition (between 0 and n-1) of a key.
 * The hashers below throw an Exception if n is not positive.
 */
using PartitionerHasher = std::function<int32_t(std::string_view key, int32_t n)>;

/**
 * @brief 32-bit hash function over a key.
 */
using HashFunction = std::function<uint32_t(std::string_view key)>;

/**
 * @brief The 32-bit murmur2 hash used by the Java client to partition
 * keyed records.
 */
uint32_t murmur2(std::string_view data);

/**
 * @brief Hasher that partitions like the Java client: the sign bit of the
 * hash is masked before taking the hash modulo n.
 */
PartitionerHasher KafkaHasher(HashFunction hash = murmur2);

/**
 * @brief Hasher that partitions like Sarama: the hash is taken as a signed
 * 32-bit integer modulo n, and a negative result is negated.
 */
PartitionerHasher SaramaHasher(HashFunction hash = murmur2);

class Partitioner {

    public:

    /**
     * @brief Constructor. Builds an invalid Partitioner.
     */
    Partitioner();

    /**
     * @brief Constructor from an implementation.
     */
    Partitioner(const std::shared_ptr<PartitionerInterface>& impl);

    /**
     * @brief Copy-constructor.
     */
    Partitioner(const Partitioner&);

    /**
     * @brief Move-constructor.
     */
    Partitioner(Partitioner&&);

    /**
     * @brief copy-assignment operator.
     */
    Partitioner& operator=(const Partitioner&);

    /**
     * @brief Move-assignment operator.
     */
    Partitioner& operator=(Partitioner&&);

    /**
     * @brief Destructor.
     */
    ~Partitioner();

    /**
     * @brief Checks for the validity of the underlying pointer.
     */
    operator bool() const;

    /**
     * @brief Creates the TopicPartitioner for the given topic.
     */
    std::unique_ptr<TopicPartitioner> forTopic(std::string_view topic) const;

    /**
     * @brief Configuration of the underlying implementation.
     */
    nlohmann::json config() const;

    /**
     * @brief Partitioner that returns the partition already set on each
     * record. An invalid partition is not corrected here; it makes the
     * record fail when it is sent.
     */
    static Partitioner Manual();

    /**
     * @brief Partitioner wrapping a single function. The function is called
     * once per topic and returns the function used to partition the
     * records of that topic. Such a partitioner always requires consistency.
     */
    static Partitioner BasicConsistent(
        std::function<std::function<int32_t(const Record&, int32_t)>(std::string_view)> fn);

    /**
     * @brief Partitioner that pins a random partition until a new batch is
     * started, and then moves to another random partition, never choosing
     * the partition it just left (unless there is only one).
     */
    static Partitioner Sticky();

    /**
     * @brief Sticky partitioner that hashes keyed records with the provided
     * hasher (by default, exactly like the Java client does). Only keyless
     * records are subject to the sticky logic.
     *
     * Without a hasher, the configuration reports the "kafka" hasher and
     * can be passed back to FromConfig. A user-provided hasher is reported
     * as "custom", which FromConfig rejects; use FromConfig with "sarama"
     * to get a Sarama-compatible partitioner that round-trips.
     */
    static Partitioner StickyKey(PartitionerHasher hasher = {});

    /**
     * @brief Partitioner that pins the partition with the least buffered
     * records until a new batch is started. Ties go to the lowest index
     * among those scanned first.
     */
    static Partitioner LeastBackup();

    /**
     * @brief Partitioner choosing a random partition for every record.
     */
    static Partitioner Random();

    /**
     * @brief Creates a Partitioner from a JSON configuration. The "type"
     * field selects the implementation ("manual", "sticky", "sticky_key",
     * "least_backup", "random", or any registered name, optionally in the
     * "name:library.so" form). For "sticky_key", a "hasher" field may be
     * set to "kafka" (default) or "sarama".
     */
    static Partitioner FromConfig(const nlohmann::json& config);

    private:

    std::shared_ptr<PartitionerInterface> self;
};

/**
 * @brief Chooses the partition of a record, calling partitionByBackup()
 * if the TopicPartitioner supports it and partition() otherwise.
 *
 * @param partitioner TopicPartitioner of the record's topic.
 * @param record Record.
 * @param n Number of partitions.
 * @param buffered Function returning the number of records buffered for
 * a partition index. Only called for backup-aware partitioners.
 */
int32_t selectPartition(TopicPartitioner& partitioner,
                        const Record& record,
                        int32_t n,
                        const PartitionBackups::BufferedFn& buffered = {});

using PartitionerFactory = Factory<PartitionerInterface, const nlohmann::json&>;

#define KCORE_REGISTER_PARTITIONER(__name__, __type__) \
    KCORE_REGISTER_IMPLEMENTATION_FOR(PartitionerFactory, __type__, __name__)

}

#endif
