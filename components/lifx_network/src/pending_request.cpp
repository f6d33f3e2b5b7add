#include "lifx_network/pending_request.hpp"

namespace lifx_network {

PendingRequest::PendingRequest(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

bool PendingRequest::deliver(Response response) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(std::move(response));
    }
    cv_.notify_one();
    return true;
}

void PendingRequest::fail(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        error_ = error;
    }
    cv_.notify_all();
}

void PendingRequest::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<Response> PendingRequest::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });

    if (!queue_.empty()) {
        Response response = std::move(queue_.front());
        queue_.pop_front();
        return response;
    }
    if (error_) {
        std::rethrow_exception(error_);
    }
    return std::nullopt;
}

bool PendingRequest::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t PendingRequest::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::shared_ptr<PendingRequest> PendingRequestTable::add(const RequestKey& key, size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.find(key) != requests_.end()) {
        return nullptr;
    }
    auto request = std::make_shared<PendingRequest>(capacity);
    requests_.emplace(key, request);
    return request;
}

bool PendingRequestTable::deliver(const RequestKey& key, Response response) {
    std::shared_ptr<PendingRequest> request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(key);
        if (it == requests_.end() && !key.serial.isZero()) {
            it = requests_.find(RequestKey{key.source, key.sequence, lifx_protocol::Serial()});
        }
        if (it == requests_.end()) {
            return false;
        }
        request = it->second;
    }
    return request->deliver(std::move(response));
}

void PendingRequestTable::remove(const RequestKey& key) {
    std::shared_ptr<PendingRequest> request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(key);
        if (it == requests_.end()) {
            return;
        }
        request = std::move(it->second);
        requests_.erase(it);
    }
    request->close();
}

bool PendingRequestTable::contains(const RequestKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.find(key) != requests_.end();
}

void PendingRequestTable::failAll(std::exception_ptr error) {
    std::unordered_map<RequestKey, std::shared_ptr<PendingRequest>, RequestKeyHash> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(requests_);
    }
    for (auto& entry : drained) {
        entry.second->fail(error);
    }
}

size_t PendingRequestTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

} // namespace lifx_network
