#pragma once

#include "cipherlink/identity/account_identity.hpp"
#include "cipherlink/configuration/kdf_config.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace cipherlink::identity {

/**
 * @brief Dedicated thread for Argon2id derivations
 *
 * Requests are queued and processed one at a time; each caller gets a
 * future for its own result. No state is shared with the dispatch context
 * beyond the request and the promise.
 *
 * Destruction stops the thread after the running job; jobs still queued
 * complete with an InvalidState failure.
 */
class IdentityDerivationWorker {
public:
    using DeriveResult = Result<DerivedIdentity, CipherlinkFailure>;

    explicit IdentityDerivationWorker(configuration::KdfConfig config = configuration::KdfConfig::Default());
    ~IdentityDerivationWorker();

    IdentityDerivationWorker(const IdentityDerivationWorker&) = delete;
    IdentityDerivationWorker& operator=(const IdentityDerivationWorker&) = delete;

    [[nodiscard]] std::future<DeriveResult> Submit(std::string passphrase, std::string salt);

    [[nodiscard]] std::future<DeriveResult> Submit(
        std::string passphrase,
        std::string salt,
        configuration::KdfConfig config);

private:
    struct Job {
        std::string passphrase;
        std::string salt;
        configuration::KdfConfig config;
        std::promise<DeriveResult> promise;
    };

    void Run();

    configuration::KdfConfig default_config_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace cipherlink::identity
