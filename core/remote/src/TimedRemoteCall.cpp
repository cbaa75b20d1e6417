#include "TimedRemoteCall.h"
#include "Logger.h"
#include <condition_variable>
#include <mutex>
#include <optional>

namespace ChunkVault {

    namespace {
        const char* COMPONENT = "TimedRemoteCall";

        template<typename T>
        struct PendingCall {
            std::mutex mutex;
            std::condition_variable ready;
            std::optional<Result<T>> result;
            bool abandoned{false};
        };

        template<typename T, typename Call>
        Result<T> invoke(Call& call) {
            try {
                return call();
            } catch (const std::exception& e) {
                return Err(Core::ErrorCode::REMOTE_UNAVAILABLE, std::string("Remote call threw: ") + e.what(),
                           COMPONENT);
            }
        }

        // onLate receives the result of a call whose caller already timed out
        template<typename T, typename Call, typename Late>
        Result<T> runWithDeadline(ThreadPool& pool, std::shared_ptr<std::atomic<uint64_t>> lateResults,
                                  Call call, Late onLate, std::chrono::milliseconds timeout,
                                  const std::string& what) {
            if (timeout.count() <= 0) {
                return invoke<T>(call);
            }

            auto pending = std::make_shared<PendingCall<T>>();
            pool.enqueue([pending, lateResults, call, onLate]() mutable {
                {
                    std::lock_guard<std::mutex> lock(pending->mutex);
                    if (pending->abandoned) {
                        return;
                    }
                }

                Result<T> result = invoke<T>(call);

                std::unique_lock<std::mutex> lock(pending->mutex);
                if (pending->abandoned) {
                    lock.unlock();
                    lateResults->fetch_add(1);
                    onLate(result);
                    return;
                }
                pending->result.emplace(std::move(result));
                lock.unlock();
                pending->ready.notify_all();
            });

            std::unique_lock<std::mutex> lock(pending->mutex);
            if (!pending->ready.wait_for(lock, timeout, [&pending]() { return pending->result.has_value(); })) {
                pending->abandoned = true;
                lock.unlock();
                Logger::instance().warn(what + " timed out after " + std::to_string(timeout.count()) + " ms",
                                        COMPONENT);
                return Err(Core::ErrorCode::REMOTE_TIMEOUT,
                           what + " exceeded " + std::to_string(timeout.count()) + " ms", COMPONENT);
            }
            return std::move(*pending->result);
        }
    }

    TimedRemoteCall::TimedRemoteCall(std::size_t workerCount)
        : lateResults_(std::make_shared<std::atomic<uint64_t>>(0)),
          pool_(workerCount == 0 ? 1 : workerCount) {}

    Result<std::string> TimedRemoteCall::push(std::shared_ptr<IRemoteStore> client,
                                              std::shared_ptr<const std::vector<uint8_t>> bytes,
                                              std::chrono::milliseconds timeout) {
        std::string what = "push of " + std::to_string(bytes->size()) + " bytes";
        return runWithDeadline<std::string>(
            pool_, lateResults_,
            [client, bytes]() { return client->push(*bytes); },
            [client, what](const Result<std::string>& late) {
                if (late.isError()) {
                    return;
                }
                // Nothing will reference this object; take it back off the remote
                auto removed = client->remove(late.value());
                if (removed.isError()) {
                    Logger::instance().warn("Late " + what + " left orphan " + late.value() + ": " +
                                            removed.error().toString(), COMPONENT);
                } else {
                    Logger::instance().info("Removed orphan " + late.value() + " from late " + what, COMPONENT);
                }
            },
            timeout, what);
    }

    Result<std::vector<uint8_t>> TimedRemoteCall::pull(std::shared_ptr<IRemoteStore> client,
                                                       const std::string& remoteHandle,
                                                       std::chrono::milliseconds timeout) {
        return runWithDeadline<std::vector<uint8_t>>(
            pool_, lateResults_,
            [client, remoteHandle]() { return client->pull(remoteHandle); },
            [](const Result<std::vector<uint8_t>>&) {},
            timeout, "pull of " + remoteHandle);
    }

} // namespace ChunkVault
