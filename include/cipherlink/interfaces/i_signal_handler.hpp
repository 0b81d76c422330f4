#pragma once
#include "call/call_signal.pb.h"
#include <string>
namespace cipherlink::interfaces {
/// Receives call signals, whether pushed by the relay or tunnelled in a chat payload
class ISignalHandler {
public:
    virtual ~ISignalHandler() = default;
    virtual void OnSignal(const std::string& from, const proto::call::CallSignal& signal) = 0;
};
}
