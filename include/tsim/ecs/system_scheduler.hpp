#pragma once

/// @file system_scheduler.hpp
/// @brief System scheduling with dependency management for the ECS.
///
/// SystemScheduler manages system registration, stage-based grouping,
/// dependency-driven topological ordering, and runtime enable/disable.
/// Execution is strictly sequential: exactly one system runs at a time,
/// to completion, in the built order.

#include <array>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace tsim::sim {
struct SimContext;
} // namespace tsim::sim

namespace tsim::ecs {

// ── System type identification ──────────────────────────────────────────

/// Integer type used to identify system types at runtime.
using SystemTypeId = uint32_t;

/// Sentinel value meaning "no system type".
constexpr SystemTypeId kInvalidSystemTypeId = static_cast<SystemTypeId>(-1);

namespace detail {

/// Global atomic counter for generating unique SystemTypeId values.
inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Obtain the unique SystemTypeId for system type `T`.
///
/// Usage:
/// @code
///   auto id = SystemType<NeedsSystem>::Id();
/// @endcode
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

// ── Execution stages ────────────────────────────────────────────────────

/// Execution stage for a system.  Stages are executed in order:
/// PreUpdate -> Update -> PostUpdate.
enum class SystemStage : uint8_t {
    PreUpdate,   ///< State decay and passive gains
    Update,      ///< Main simulation update
    PostUpdate   ///< Decisions made on the post-update state
};

inline constexpr std::size_t kSystemStageCount = 3;

// ── System interface ────────────────────────────────────────────────────

/// Abstract base class for simulation systems.
///
/// Concrete systems override `Execute()` and optionally `GetStage()`.
/// The scheduler owns and manages the lifecycle of registered systems.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Advance this system by one simulation tick.
    ///
    /// @param ctx  Per-simulation context (entities, world, content, time,
    ///             random source). Systems keep no reference to it
    ///             between calls.
    virtual void Execute(tsim::sim::SimContext& ctx) = 0;

    /// Return the execution stage this system belongs to.
    /// Default is SystemStage::Update.
    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    /// Return a human-readable name for this system (for diagnostics).
    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

// ── System scheduler ────────────────────────────────────────────────────

/// Manages system registration, dependency ordering, and staged execution.
///
/// Systems are grouped by stage and topologically sorted within each
/// stage according to explicit dependencies. Systems without a mutual
/// ordering constraint keep their registration order, so the plan is
/// identical across runs. Circular dependencies are detected at build
/// time and reported via an error string.
class SystemScheduler {
public:
    SystemScheduler() = default;

    // Non-copyable, movable.
    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;
    SystemScheduler(SystemScheduler&&) noexcept = default;
    SystemScheduler& operator=(SystemScheduler&&) noexcept = default;

    // ── Registration ────────────────────────────────────────────────

    /// Register a system of type `T`, constructing it in-place.
    ///
    /// The system's stage is determined by `T::GetStage()`.
    /// Re-registering the same type is a no-op and returns the
    /// existing instance.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    /// Return the number of registered systems.
    [[nodiscard]] std::size_t SystemCount() const noexcept;

    // ── Dependencies ────────────────────────────────────────────────

    /// Declare that `before` must execute before `after`.
    ///
    /// Both systems must already be registered and share a stage
    /// (stage ordering is implicit).
    ///
    /// @return true if the dependency was added.
    bool AddDependency(SystemTypeId before, SystemTypeId after);

    /// Convenience: declare a dependency using system types.
    template <typename Before, typename After>
    bool AddDependency();

    // ── Enable / disable ────────────────────────────────────────────

    /// Enable or disable a system at runtime.
    ///
    /// Disabled systems are skipped during execution without changing
    /// the execution plan.
    void SetEnabled(SystemTypeId system, bool enabled);

    template <typename T>
    void SetEnabled(bool enabled);

    [[nodiscard]] bool IsEnabled(SystemTypeId system) const;

    // ── Execution ───────────────────────────────────────────────────

    /// Build the execution plan (topological sort per stage).
    ///
    /// Returns true on success. On failure (circular dependency),
    /// returns false and populates the error string retrievable via
    /// GetLastError().
    [[nodiscard]] bool Build();

    /// Whether the current plan is up to date.
    [[nodiscard]] bool IsBuilt() const noexcept { return built_; }

    /// Execute all enabled systems in stage order.
    ///
    /// @pre Build() must have been called successfully.
    void Execute(tsim::sim::SimContext& ctx);

    /// Return the error message from the last failed Build().
    [[nodiscard]] const std::string& GetLastError() const noexcept;

    // ── Queries ─────────────────────────────────────────────────────

    /// Retrieve a registered system by type.
    ///
    /// @return Pointer to the system, or nullptr if not registered.
    template <typename T>
    [[nodiscard]] T* GetSystem();

    template <typename T>
    [[nodiscard]] const T* GetSystem() const;

    /// Retrieve the execution order for a specific stage (after Build).
    [[nodiscard]] const std::vector<SystemTypeId>&
    GetExecutionOrder(SystemStage stage) const;

    /// Names of all systems in full execution order (after Build).
    [[nodiscard]] std::vector<std::string_view> GetExecutionNames() const;

private:
    /// Internal entry for a registered system.
    struct SystemEntry {
        std::unique_ptr<ISystem> instance;
        SystemTypeId typeId = kInvalidSystemTypeId;
        SystemStage stage = SystemStage::Update;
        bool enabled = true;
    };

    /// Perform topological sort on systems within a stage.
    [[nodiscard]] bool topologicalSort(
        const std::vector<SystemTypeId>& ids,
        std::vector<SystemTypeId>& sorted);

    /// All registered systems, keyed by SystemTypeId.
    std::unordered_map<SystemTypeId, SystemEntry> systems_;

    /// Systems grouped by stage (registration order within stage).
    std::array<std::vector<SystemTypeId>, kSystemStageCount> stageGroups_;

    /// Dependency edges: dependencies_[A] contains all B where A -> B
    /// (A must run before B), in declaration order.
    std::unordered_map<SystemTypeId, std::vector<SystemTypeId>> dependencies_;

    /// Reverse dependency edges: reverseDeps_[B] contains all A where A -> B.
    std::unordered_map<SystemTypeId, std::vector<SystemTypeId>> reverseDeps_;

    /// Computed execution order per stage (populated by Build()).
    std::array<std::vector<SystemTypeId>, kSystemStageCount> executionOrder_;

    bool built_ = false;
    std::string lastError_;
};

// ── Template implementations ────────────────────────────────────────────

template <typename T, typename... Args>
T& SystemScheduler::Register(Args&&... args) {
    static_assert(std::is_base_of_v<ISystem, T>, "T must derive from ISystem");

    const auto typeId = SystemType<T>::Id();

    // Return existing instance if already registered.
    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T&>(*it->second.instance);
    }

    auto system = std::make_unique<T>(std::forward<Args>(args)...);
    T& ref = *system;

    SystemEntry entry;
    entry.instance = std::move(system);
    entry.typeId = typeId;
    entry.stage = ref.GetStage();
    entry.enabled = true;

    stageGroups_[static_cast<std::size_t>(entry.stage)].push_back(typeId);
    systems_.emplace(typeId, std::move(entry));

    // Invalidate any previously built plan.
    built_ = false;

    return ref;
}

template <typename Before, typename After>
bool SystemScheduler::AddDependency() {
    return AddDependency(SystemType<Before>::Id(), SystemType<After>::Id());
}

template <typename T>
void SystemScheduler::SetEnabled(bool enabled) {
    SetEnabled(SystemType<T>::Id(), enabled);
}

template <typename T>
T* SystemScheduler::GetSystem() {
    const auto typeId = SystemType<T>::Id();
    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T*>(it->second.instance.get());
    }
    return nullptr;
}

template <typename T>
const T* SystemScheduler::GetSystem() const {
    const auto typeId = SystemType<T>::Id();
    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<const T*>(it->second.instance.get());
    }
    return nullptr;
}

} // namespace tsim::ecs
