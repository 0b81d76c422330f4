#include "cipherlink/identity/identity_derivation_worker.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"

namespace cipherlink::identity {

namespace {
    void WipeString(std::string& value) {
        (void)crypto::SodiumInterop::SecureWipe(
            std::span<uint8_t>(reinterpret_cast<uint8_t*>(value.data()), value.size()));
        value.clear();
    }
}

IdentityDerivationWorker::IdentityDerivationWorker(const configuration::KdfConfig config)
    : default_config_(config)
    , thread_([this] { Run(); }) {}

IdentityDerivationWorker::~IdentityDerivationWorker() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    for (auto& job : jobs_) {
        WipeString(job.passphrase);
        job.promise.set_value(DeriveResult::Err(
            CipherlinkFailure::InvalidState("Derivation worker shut down")));
    }
}

std::future<IdentityDerivationWorker::DeriveResult> IdentityDerivationWorker::Submit(
    std::string passphrase,
    std::string salt) {
    return Submit(std::move(passphrase), std::move(salt), default_config_);
}

std::future<IdentityDerivationWorker::DeriveResult> IdentityDerivationWorker::Submit(
    std::string passphrase,
    std::string salt,
    const configuration::KdfConfig config) {
    Job job{std::move(passphrase), std::move(salt), config, {}};
    auto future = job.promise.get_future();
    {
        std::lock_guard lock(mutex_);
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return future;
}

void IdentityDerivationWorker::Run() {
    for (;;) {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
        if (stopping_) {
            return;
        }
        Job job = std::move(jobs_.front());
        jobs_.pop_front();
        lock.unlock();

        auto result = IdentityDerivation::Derive(job.passphrase, job.salt, job.config);
        WipeString(job.passphrase);
        job.promise.set_value(std::move(result));
    }
}

} // namespace cipherlink::identity
