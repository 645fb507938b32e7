#include "LineStreamAdapter.hpp"
#include <trantor/utils/Logger.h>

LineStreamAdapter::LineStreamAdapter(std::unique_ptr<ReverseBlockReader> reader)
    : reader_(std::move(reader)) {}

void LineStreamAdapter::prime(size_t maxSteps) {
    if (outcome_ != Outcome::Pending) {
        return;
    }
    for (size_t i = 0; i < maxSteps && primed_.empty(); ++i) {
        ++stepsRun_;
        if (!reader_->step(primed_)) {
            break;
        }
    }
}

bool LineStreamAdapter::pull(std::string& out) {
    if (outcome_ != Outcome::Pending) {
        return false;
    }
    if (!primed_.empty()) {
        bytesDelivered_ += primed_.size();
        out.append(primed_);
        primed_.clear();
    } else if (reader_->state() != ReverseBlockReader::State::Done) {
        size_t before = out.size();
        try {
            ++stepsRun_;
            reader_->step(out);
        } catch (const std::exception& e) {
            out.resize(before);
            error_ = e.what();
            LOG_ERROR << "Stream aborted for " << reader_->session().path() << ": " << error_;
            complete(Outcome::Failed);
            if (onAbort_) onAbort_(error_);
            return false;
        }
        bytesDelivered_ += out.size() - before;
    }
    if (reader_->state() == ReverseBlockReader::State::Done) {
        complete(Outcome::Completed);
        return false;
    }
    return true;
}

void LineStreamAdapter::cancel() {
    if (outcome_ != Outcome::Pending) {
        return;
    }
    reader_->cancel();
    primed_.clear();
    complete(Outcome::Cancelled);
}

void LineStreamAdapter::complete(Outcome outcome) {
    outcome_ = outcome;
    if (onFinish_) onFinish_(outcome);
}
