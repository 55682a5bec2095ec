#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include <functional>
#include <span>
#include <string>

namespace blockvault::interfaces {

/// What the borrowed material will be used for. Expired keys may still
/// open ciphertext issued before expiry until they are purged.
enum class KeyUsage {
    Encrypt,
    Decrypt
};

/// Lends key material for the duration of one callback. The span must not
/// outlive the call.
class IKeyProvider {
public:
    virtual ~IKeyProvider() = default;

    [[nodiscard]] virtual Result<Unit, TransferFailure> ExecuteWithKey(
        const std::string& key_id,
        std::function<Result<Unit, TransferFailure>(std::span<const uint8_t>)> operation) = 0;

    [[nodiscard]] virtual Result<Unit, TransferFailure> ExecuteWithKeyForDecrypt(
        const std::string& key_id,
        std::function<Result<Unit, TransferFailure>(std::span<const uint8_t>)> operation) = 0;

    template<typename T>
    [[nodiscard]] Result<T, TransferFailure> ExecuteWithKeyTyped(
        const std::string& key_id,
        std::function<Result<T, TransferFailure>(std::span<const uint8_t>)> operation,
        const KeyUsage usage = KeyUsage::Encrypt) {
        Result<T, TransferFailure> result_holder =
            Result<T, TransferFailure>::Err(
                TransferFailure::Generic("Operation not executed"));
        auto wrapper = [&operation, &result_holder](std::span<const uint8_t> key)
            -> Result<Unit, TransferFailure> {
            result_holder = operation(key);
            return result_holder.IsOk()
                ? Result<Unit, TransferFailure>::Ok(Unit{})
                : Result<Unit, TransferFailure>::Err(result_holder.UnwrapErr());
        };
        auto exec_result = usage == KeyUsage::Decrypt
            ? ExecuteWithKeyForDecrypt(key_id, wrapper)
            : ExecuteWithKey(key_id, wrapper);
        if (exec_result.IsErr()) {
            return Result<T, TransferFailure>::Err(exec_result.UnwrapErr());
        }
        return result_holder;
    }
};

}
