#pragma once

#include "../ports/IHistoryListener.hpp"
#include <functional>
#include <memory>

namespace evhistory::adapters {

class CallbackListener : public ports::IHistoryListener {
public:
    using Callback = std::function<void(const EventRecord&)>;

    explicit CallbackListener(Callback callback) : callback_(std::move(callback)) {}

    void eventOccurred(const EventRecord& record) override {
        if (callback_) {
            callback_(record);
        }
    }

private:
    Callback callback_;
};

inline std::shared_ptr<CallbackListener> makeListener(CallbackListener::Callback callback) {
    return std::make_shared<CallbackListener>(std::move(callback));
}

} // namespace evhistory::adapters
