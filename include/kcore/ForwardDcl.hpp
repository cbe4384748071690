/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef KCORE_FORWARD_DECL_HPP
#define KCORE_FORWARD_DECL_HPP

namespace kcore {

class BatchEncoder;
class ClientError;
struct CompressionCodec;
class Compressor;
class CompressorInterface;
struct ConsumeOptions;
class DirectAssigner;
class Exception;
class Offset;
class Partitioner;
class PartitionerInterface;
class PartitionBackups;
class ProduceRequest;
struct ProducerConfig;
struct Record;
struct RecordHeader;
class RecordBatch;
struct NumberedRecord;
struct RequiredAcks;
class TopicBackupPartitioner;
class TopicMatcher;
class TopicPartitioner;
class WireReader;
class WireWriter;

}

#endif
