#include "photovault/core/CollectionRekeyer.hpp"

#include "photovault/container/ContainerRekey.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <variant>

namespace photovault::core
{
namespace
{

// Two spellings of one file must not end up in two workers at once.
[[nodiscard]] std::vector<std::filesystem::path> distinctPaths(std::span<const std::filesystem::path> paths)
{
    std::vector<std::filesystem::path> out{};
    std::unordered_set<std::string> seen{};
    out.reserve(paths.size());
    for (const auto& p : paths)
    {
        std::error_code ec{};
        auto key{ std::filesystem::weakly_canonical(p, ec) };
        if (ec)
        {
            key = p.lexically_normal();
        }
        if (seen.insert(key.string()).second)
        {
            out.push_back(p);
        }
    }
    return out;
}

} // namespace

CollectionRekeyer::CollectionRekeyer(photovault::container::ContainerCodec& codec, std::size_t maxConcurrent)
    : m_codec{ &codec }, m_maxConcurrent{ maxConcurrent }
{
    if (m_maxConcurrent == 0U)
    {
        throw std::invalid_argument("CollectionRekeyer: maxConcurrent must be at least 1");
    }
}

RotationReport CollectionRekeyer::run(std::span<const std::filesystem::path> paths,
                                      const photovault::crypto::ContainerKeys& oldKeys,
                                      const photovault::crypto::ContainerKeys& newKeys,
                                      const SkipPredicate& alreadyRotated, const RotatedCallback& onRotated,
                                      std::stop_token stop) const
{
    const auto work{ distinctPaths(paths) };
    RotationReport report{};
    std::mutex reportMutex{};
    std::atomic<std::size_t> next{ 0U };

    auto worker = [&]() {
        for (;;)
        {
            if (stop.stop_requested())
            {
                const std::lock_guard lock{ reportMutex };
                report.cancelled = true;
                return;
            }
            const std::size_t index{ next.fetch_add(1U) };
            if (index >= work.size())
            {
                return;
            }
            const auto& path{ work[index] };

            if (alreadyRotated)
            {
                const std::lock_guard lock{ reportMutex };
                if (alreadyRotated(path))
                {
                    report.skipped.push_back(path);
                    continue;
                }
            }

            photovault::container::ContainerResult<std::monostate> result{
                photovault::container::ContainerError{}
            };
            try
            {
                result = photovault::container::reencryptContainer(*m_codec, path, oldKeys, newKeys, stop);
            }
            catch (const std::exception& e)
            {
                result = photovault::container::ContainerError{ .code = photovault::container::ContainerErrc::IoError,
                                                                .reason = e.what(),
                                                                .path = path };
            }

            const std::lock_guard lock{ reportMutex };
            if (std::holds_alternative<std::monostate>(result))
            {
                report.succeeded.push_back(path);
                if (onRotated)
                {
                    onRotated(path);
                }
            }
            else if (std::holds_alternative<photovault::container::OperationCancelled>(result))
            {
                report.cancelled = true;
            }
            else
            {
                report.failed.push_back(
                    RotationFailure{ .path = path, .error = std::get<photovault::container::ContainerError>(result) });
            }
        }
    };

    {
        const std::size_t workerCount{ std::min(m_maxConcurrent, work.size()) };
        std::vector<std::jthread> workers{};
        workers.reserve(workerCount);
        for (std::size_t i{}; i < workerCount; ++i)
        {
            workers.emplace_back(worker);
        }
    }

    std::sort(report.succeeded.begin(), report.succeeded.end());
    std::sort(report.skipped.begin(), report.skipped.end());
    std::sort(report.failed.begin(), report.failed.end(),
              [](const RotationFailure& a, const RotationFailure& b) { return a.path < b.path; });
    return report;
}

} // namespace photovault::core
