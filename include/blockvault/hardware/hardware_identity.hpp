#pragma once
#include "blockvault/core/failures.hpp"
#include "blockvault/core/result.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blockvault::hardware {

/// One named machine identifier, e.g. {"machine_id", "4c4c4544..."}.
struct HardwareComponent {
    std::string name;
    std::string value;
};

struct HardwareIdentity {
    std::vector<HardwareComponent> components;

    [[nodiscard]] bool IsEmpty() const noexcept { return components.empty(); }
};

class IHardwareIdentitySource {
public:
    virtual ~IHardwareIdentitySource() = default;

    /// Collects whatever identifiers are available on this machine.
    /// Fails with HardwareUnavailable only when no source produced anything.
    [[nodiscard]] virtual Result<HardwareIdentity, TransferFailure> Collect() = 0;
};

/// Linux identity source. Components, each optional:
///   machine_id   /etc/machine-id, then /var/lib/dbus/machine-id
///   cpu          cpuid vendor + signature on x86, uname machine elsewhere
///   hostname     uname nodename
///   installation random id persisted under the marker directory (0600)
class SystemHardwareIdentity final : public IHardwareIdentitySource {
public:
    explicit SystemHardwareIdentity(std::filesystem::path marker_directory);

    [[nodiscard]] Result<HardwareIdentity, TransferFailure> Collect() override;

private:
    [[nodiscard]] static std::optional<std::string> ReadMachineId();
    [[nodiscard]] static std::optional<std::string> ReadCpuIdentity();
    [[nodiscard]] static std::optional<std::string> ReadHostName();
    [[nodiscard]] std::optional<std::string> ReadOrCreateInstallationMarker() const;

    std::filesystem::path marker_directory_;
};

class HardwareFingerprint {
public:
    /// Hex SHA-256 over the sorted "name=value" lines of @p identity.
    [[nodiscard]] static Result<std::string, TransferFailure> Compute(const HardwareIdentity& identity);

    /// Collect() followed by Compute().
    [[nodiscard]] static Result<std::string, TransferFailure> FromSource(IHardwareIdentitySource& source);

private:
    HardwareFingerprint() = delete;
};

}  // namespace blockvault::hardware
