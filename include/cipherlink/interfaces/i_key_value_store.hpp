#pragma once
#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include <optional>
#include <string>
#include <string_view>
namespace cipherlink::interfaces {
/// Local persistent store. Values are opaque serialized records.
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;
    [[nodiscard]] virtual Result<std::optional<std::string>, CipherlinkFailure> Get(
        std::string_view ns, std::string_view key) = 0;
    [[nodiscard]] virtual Result<Unit, CipherlinkFailure> Put(
        std::string_view ns, std::string_view key, std::string value) = 0;
    [[nodiscard]] virtual Result<Unit, CipherlinkFailure> Erase(
        std::string_view ns, std::string_view key) = 0;
};
}
