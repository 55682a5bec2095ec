#include "blockvault/hardware/hardware_identity.hpp"
#include "blockvault/core/logging.hpp"
#include "blockvault/crypto/sodium_interop.hpp"
#include "blockvault/transfer/constants.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <sys/utsname.h>
#include <unistd.h>

#if defined(__GNUC__) && (defined(__x86_64__) || defined(__i386__))
#include <cpuid.h>
#endif

namespace blockvault::hardware {
    using crypto::SodiumInterop;

    namespace {
        constexpr const char* kComponent = "hardware";

        std::string Trim(std::string value) {
            const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
            value.erase(value.begin(), std::find_if_not(value.begin(), value.end(), is_space));
            value.erase(std::find_if_not(value.rbegin(), value.rend(), is_space).base(), value.end());
            return value;
        }

        std::optional<std::string> ReadFirstLine(const std::filesystem::path& path) {
            std::ifstream in(path);
            if (!in) {
                return std::nullopt;
            }
            std::string value;
            std::getline(in, value);
            value = Trim(std::move(value));
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }

        bool WriteOwnerOnly(const std::filesystem::path& path, const std::string& content) {
            const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
            if (fd < 0) {
                return false;
            }
            const ssize_t written = ::write(fd, content.data(), content.size());
            const bool synced = ::fsync(fd) == 0;
            ::close(fd);
            return written == static_cast<ssize_t>(content.size()) && synced;
        }
    }

    SystemHardwareIdentity::SystemHardwareIdentity(std::filesystem::path marker_directory)
        : marker_directory_(std::move(marker_directory)) {
    }

    Result<HardwareIdentity, TransferFailure> SystemHardwareIdentity::Collect() {
        HardwareIdentity identity;
        if (auto machine_id = ReadMachineId()) {
            identity.components.push_back({"machine_id", std::move(*machine_id)});
        }
        if (auto cpu = ReadCpuIdentity()) {
            identity.components.push_back({"cpu", std::move(*cpu)});
        }
        if (auto host = ReadHostName()) {
            identity.components.push_back({"hostname", std::move(*host)});
        }
        if (auto marker = ReadOrCreateInstallationMarker()) {
            identity.components.push_back({"installation", std::move(*marker)});
        }

        if (identity.IsEmpty()) {
            BLOCKVAULT_LOG_ERROR(kComponent, "no hardware identity source available");
            return Result<HardwareIdentity, TransferFailure>::Err(
                TransferFailure::HardwareUnavailable("No hardware identity source available"));
        }
        if (identity.components.size() < 4) {
            BLOCKVAULT_LOG_DEBUG(kComponent, "best-effort identity with {} of 4 components",
                identity.components.size());
        }
        return Result<HardwareIdentity, TransferFailure>::Ok(std::move(identity));
    }

    std::optional<std::string> SystemHardwareIdentity::ReadMachineId() {
        constexpr const char* kCandidates[] = {"/etc/machine-id", "/var/lib/dbus/machine-id"};
        for (const char* path : kCandidates) {
            if (auto value = ReadFirstLine(path)) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> SystemHardwareIdentity::ReadCpuIdentity() {
#if defined(__GNUC__) && (defined(__x86_64__) || defined(__i386__))
        unsigned int eax = 0;
        unsigned int ebx = 0;
        unsigned int ecx = 0;
        unsigned int edx = 0;
        const unsigned int max_leaf = __get_cpuid_max(0, nullptr);
        if (max_leaf == 0) {
            return std::nullopt;
        }
        __cpuid(0, eax, ebx, ecx, edx);
        std::array<char, 13> vendor{};
        std::memcpy(vendor.data(), &ebx, 4);
        std::memcpy(vendor.data() + 4, &edx, 4);
        std::memcpy(vendor.data() + 8, &ecx, 4);
        std::string result(vendor.data());
        if (max_leaf >= 1) {
            __cpuid(1, eax, ebx, ecx, edx);
            result += ":" + std::to_string(eax);
        }
        return result;
#else
        struct utsname info {
        };
        if (uname(&info) == 0 && info.machine[0] != '\0') {
            return std::string(info.machine);
        }
        return std::nullopt;
#endif
    }

    std::optional<std::string> SystemHardwareIdentity::ReadHostName() {
        struct utsname info {
        };
        if (uname(&info) == 0) {
            std::string node(info.nodename);
            if (!node.empty()) {
                return node;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> SystemHardwareIdentity::ReadOrCreateInstallationMarker() const {
        if (marker_directory_.empty()) {
            return std::nullopt;
        }
        const auto path = marker_directory_ / std::string(kInstallationMarkerFileName);
        if (auto existing = ReadFirstLine(path)) {
            return existing;
        }
        std::error_code ec;
        std::filesystem::create_directories(marker_directory_, ec);
        if (ec) {
            BLOCKVAULT_LOG_WARN(kComponent, "cannot create marker directory {}: {}",
                marker_directory_.string(), ec.message());
            return std::nullopt;
        }
        const std::string marker = SodiumInterop::GetRandomHex(16);
        if (!WriteOwnerOnly(path, marker + "\n")) {
            // Lost a creation race with another process; use its value.
            return ReadFirstLine(path);
        }
        BLOCKVAULT_LOG_INFO(kComponent, "created installation marker {}", path.string());
        return marker;
    }

    Result<std::string, TransferFailure> HardwareFingerprint::Compute(const HardwareIdentity& identity) {
        if (identity.IsEmpty()) {
            return Result<std::string, TransferFailure>::Err(
                TransferFailure::HardwareUnavailable("Hardware identity has no components"));
        }
        std::vector<std::string> lines;
        lines.reserve(identity.components.size());
        for (const auto& component : identity.components) {
            lines.push_back(component.name + "=" + component.value);
        }
        std::sort(lines.begin(), lines.end());

        std::string canonical;
        for (const auto& line : lines) {
            canonical += line;
            canonical += '\n';
        }
        const auto digest = SodiumInterop::Sha256(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(canonical.data()), canonical.size()));
        return Result<std::string, TransferFailure>::Ok(logging::ToHex(digest));
    }

    Result<std::string, TransferFailure> HardwareFingerprint::FromSource(IHardwareIdentitySource& source) {
        auto identity = source.Collect();
        if (identity.IsErr()) {
            return Result<std::string, TransferFailure>::Err(std::move(identity).UnwrapErr());
        }
        return Compute(identity.Unwrap());
    }

}
