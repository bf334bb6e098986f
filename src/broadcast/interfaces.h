#pragma once

#include <initializer_list>
#include <vector>

#include "decoder/record.h"

namespace FseDump {

/**
 * Interface for anything the decoder hands accepted records to
 */
class RecordPublisher {
public:
    virtual ~RecordPublisher() = default;

    // May block (backpressure) until every downstream consumer has room.
    virtual void Publish(RecordPtr record) = 0;
};

/**
 * Forwards each record to several publishers, in the order given.
 * Used to feed the job-wide hub and a per-file hub from one decode loop.
 */
class PublisherGroup : public RecordPublisher {
public:
    PublisherGroup(std::initializer_list<RecordPublisher*> publishers)
        : publishers_(publishers) {}

    void Add(RecordPublisher* publisher) { publishers_.push_back(publisher); }

    void Publish(RecordPtr record) override {
        for (auto* publisher : publishers_) {
            publisher->Publish(record);
        }
    }

private:
    std::vector<RecordPublisher*> publishers_;
};

} // namespace FseDump
