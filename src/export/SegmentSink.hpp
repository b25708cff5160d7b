/**
 * @file SegmentSink.hpp
 * @brief Consumers of classified segment records
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "habitat_analyzer.hpp"
#include <vector>

namespace habitat {

/**
 * @brief Receives segment records in emission order
 */
class SegmentSink {
public:
    virtual ~SegmentSink() = default;

    virtual void write_segment(const SegmentRecord& record) = 0;

    /**
     * @brief Called once after the last record of a run
     */
    virtual void close(const RunSummary& summary) { (void)summary; }
};

/**
 * @brief Keeps every record in memory
 */
class MemorySegmentSink : public SegmentSink {
public:
    void write_segment(const SegmentRecord& record) override { records_.push_back(record); }

    void close(const RunSummary& summary) override {
        summary_ = summary;
        closed_ = true;
    }

    const std::vector<SegmentRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool closed() const { return closed_; }
    const RunSummary& summary() const { return summary_; }

private:
    std::vector<SegmentRecord> records_;
    RunSummary summary_;
    bool closed_ = false;
};

/**
 * @brief Forwards only suitable records to another sink
 */
class SuitableOnlyFilter : public SegmentSink {
public:
    explicit SuitableOnlyFilter(SegmentSink& downstream) : downstream_(downstream) {}

    void write_segment(const SegmentRecord& record) override {
        if (record.suitable) {
            downstream_.write_segment(record);
        }
    }

    void close(const RunSummary& summary) override { downstream_.close(summary); }

private:
    SegmentSink& downstream_;
};

/**
 * @brief Fans every record out to several sinks, e.g. one per output format
 */
class SegmentSinkGroup : public SegmentSink {
public:
    void add(SegmentSink& sink) { sinks_.push_back(&sink); }
    bool empty() const { return sinks_.empty(); }

    void write_segment(const SegmentRecord& record) override {
        for (SegmentSink* sink : sinks_) {
            sink->write_segment(record);
        }
    }

    void close(const RunSummary& summary) override {
        for (SegmentSink* sink : sinks_) {
            sink->close(summary);
        }
    }

private:
    std::vector<SegmentSink*> sinks_;
};

} // namespace habitat
