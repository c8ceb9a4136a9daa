/// @file discovery_coordinator.cpp
/// @brief Discovery state transition, scoring and clue selection.

#include "game/discovery_coordinator.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

namespace waymark::game
{

namespace
{

DiscoveryOutcome failure(DiscoveryStatus status, std::string message)
{
    DiscoveryOutcome outcome;
    outcome.status = status;
    outcome.success = false;
    outcome.message = std::move(message);
    return outcome;
}

DiscoveryStatus status_for(trust::RejectionReason reason)
{
    switch (reason)
    {
        case trust::RejectionReason::InvalidReading: return DiscoveryStatus::InvalidReading;
        case trust::RejectionReason::LowAccuracy:    return DiscoveryStatus::LowAccuracy;
        case trust::RejectionReason::LowConfidence:  return DiscoveryStatus::LowAccuracy;
        case trust::RejectionReason::TooFar:         return DiscoveryStatus::TooFar;
        case trust::RejectionReason::InvalidTarget:  return DiscoveryStatus::InvalidTarget;
        case trust::RejectionReason::None:           break;
    }
    // A rejected result without a reason is a fault; fail closed
    return DiscoveryStatus::InvalidTarget;
}

std::string rejection_message(const trust::ValidationResult& v)
{
    const auto& d = v.diagnostics;
    switch (v.rejection)
    {
        case trust::RejectionReason::TooFar:
            return fmt::format("You are {:.1f}m from the evidence (GPS accuracy {:.1f}m). "
                               "Get within {:.0f}m and try again.",
                               v.distance_to_target_m, d.gps_accuracy_m, d.advisory_radius_m);
        case trust::RejectionReason::LowConfidence:
            return fmt::format("Your position could not be confirmed: {:.1f}m from the evidence "
                               "(GPS accuracy {:.1f}m). Wait for a better signal within {:.0f}m.",
                               v.distance_to_target_m, d.gps_accuracy_m, d.advisory_radius_m);
        case trust::RejectionReason::InvalidReading:
        case trust::RejectionReason::LowAccuracy:
            return fmt::format("Location reading rejected: {}", v.reason);
        case trust::RejectionReason::InvalidTarget:
        case trust::RejectionReason::None:
            break;
    }
    return "This evidence cannot be discovered right now.";
}

} // anonymous namespace

const char* discovery_status_name(DiscoveryStatus status)
{
    switch (status)
    {
        case DiscoveryStatus::Discovered:        return "discovered";
        case DiscoveryStatus::AlreadyDiscovered: return "already_discovered";
        case DiscoveryStatus::NotFound:          return "not_found";
        case DiscoveryStatus::GameNotActive:     return "game_not_active";
        case DiscoveryStatus::PlayerMismatch:    return "player_mismatch";
        case DiscoveryStatus::LikelySpoofed:     return "likely_spoofed";
        case DiscoveryStatus::InvalidReading:    return "invalid_reading";
        case DiscoveryStatus::LowAccuracy:       return "low_accuracy";
        case DiscoveryStatus::TooFar:            return "too_far";
        case DiscoveryStatus::InvalidTarget:     return "invalid_target";
        case DiscoveryStatus::StoreUnavailable:  return "store_unavailable";
    }
    return "unknown";
}

DiscoveryCoordinator::DiscoveryCoordinator(trust::SpoofDetector& spoof_detector,
                                           const trust::DiscoveryValidator& validator,
                                           SessionStore& store)
    : m_spoof_detector(spoof_detector)
    , m_validator(validator)
    , m_store(store)
{
}

DiscoveryOutcome DiscoveryCoordinator::attempt_discovery(GameSession& session,
                                                         const EvidenceId& evidence_id,
                                                         const location::LocationSample& sample,
                                                         const PlayerId& player_id)
{
    auto lock_ptr = game_lock(session.game_id);
    DiscoveryOutcome outcome;
    {
        std::lock_guard lock(*lock_ptr);
        outcome = apply(session, evidence_id, sample, player_id);
    }
    lock_ptr.reset();
    (void)release_game(session.game_id);
    return outcome;
}

DiscoveryOutcome DiscoveryCoordinator::discover(const GameId& game_id,
                                                const PlayerId& player_id,
                                                const EvidenceId& evidence_id,
                                                const location::LocationSample& sample)
{
    auto lock_ptr = game_lock(game_id);
    DiscoveryOutcome outcome;
    {
        std::lock_guard lock(*lock_ptr);
        outcome = load_apply_persist(game_id, player_id, evidence_id, sample);
    }
    lock_ptr.reset();
    (void)release_game(game_id);
    return outcome;
}

bool DiscoveryCoordinator::release_game(const GameId& game_id)
{
    std::lock_guard lock(m_locks_mutex);
    const auto it = m_game_locks.find(game_id);
    if (it == m_game_locks.end())
    {
        return false;
    }

    // Copies are only taken under m_locks_mutex, so a count of one means no
    // request holds or waits on this mutex
    if (it->second.use_count() > 1)
    {
        return false;
    }

    m_game_locks.erase(it);
    return true;
}

std::size_t DiscoveryCoordinator::tracked_game_count() const
{
    std::lock_guard lock(m_locks_mutex);
    return m_game_locks.size();
}

DiscoveryOutcome DiscoveryCoordinator::load_apply_persist(const GameId& game_id,
                                                          const PlayerId& player_id,
                                                          const EvidenceId& evidence_id,
                                                          const location::LocationSample& sample)
{
    auto session = m_store.get(game_id);
    if (!session)
    {
        return failure(DiscoveryStatus::NotFound, "Game session not found.");
    }

    if (session->player_id != player_id)
    {
        WMK_WARN("Player {} attempted a discovery in game {} owned by {}",
                 player_id, game_id, session->player_id);
        return failure(DiscoveryStatus::PlayerMismatch, "Player does not belong to this game.");
    }

    if (session->status != GameStatus::Active)
    {
        return failure(DiscoveryStatus::GameNotActive,
                       fmt::format("The game is no longer active ({}).", game_status_name(session->status)));
    }

    auto outcome = apply(*session, evidence_id, sample, player_id);
    if (outcome.status != DiscoveryStatus::Discovered)
    {
        return outcome;
    }

    if (!m_store.update(game_id, *session))
    {
        WMK_ERROR("Failed to persist discovery of {} in game {}", evidence_id, game_id);
        auto failed = failure(DiscoveryStatus::StoreUnavailable,
                              "Your discovery could not be saved. Please try again.");
        failed.distance_m = outcome.distance_m;
        failed.validation = std::move(outcome.validation);
        failed.spoofing = std::move(outcome.spoofing);
        return failed;
    }

    return outcome;
}

// -----------------------------------------------------------------
// Discovery steps (caller holds the game lock)
//
// 1. Already discovered   -> AlreadyDiscovered, no score change
// 2. Unknown evidence     -> NotFound
// 3. Spoofing heuristics  -> LikelySpoofed (history is updated either way)
// 4. Location validation  -> TooFar / LowAccuracy / InvalidReading / InvalidTarget
// 5. Mark discovered, award bonus, pick the next clue
// -----------------------------------------------------------------

DiscoveryOutcome DiscoveryCoordinator::apply(GameSession& session,
                                             const EvidenceId& evidence_id,
                                             const location::LocationSample& sample,
                                             const PlayerId& player_id)
{
    // 1.
    if (session.is_discovered(evidence_id))
    {
        DiscoveryOutcome outcome;
        outcome.status = DiscoveryStatus::AlreadyDiscovered;
        outcome.success = true;
        outcome.message = "This evidence has already been discovered.";
        return outcome;
    }

    // 2.
    const Evidence* evidence = session.find_evidence(evidence_id);
    if (evidence == nullptr)
    {
        return failure(DiscoveryStatus::NotFound, "Evidence not found.");
    }

    // 3.
    auto spoofing = m_spoof_detector.assess(sample, player_id);
    if (spoofing.is_likely_spoofed)
    {
        WMK_WARN("Likely spoofed location from player {} in game {} (risk {:.2f})",
                 player_id, session.game_id, spoofing.risk_score);
        auto outcome = failure(DiscoveryStatus::LikelySpoofed,
                               "There was an issue verifying your location. Please try again.");
        outcome.spoofing = spoofing;
        return outcome;
    }

    // 4.
    const Timestamp now = m_validator.now();
    auto validation = m_validator.validate_at(sample, evidence->target, now);
    validation.diagnostics.movement = spoofing.movement;

    if (!validation.is_valid)
    {
        WMK_DEBUG("Discovery of {} rejected for player {}: {} ({:.1f}m, confidence {:.2f})",
                  evidence_id, player_id, trust::rejection_reason_name(validation.rejection),
                  validation.distance_to_target_m, validation.confidence_score);
        auto outcome = failure(status_for(validation.rejection), rejection_message(validation));
        outcome.distance_m = validation.distance_to_target_m;
        outcome.validation = std::move(validation);
        outcome.spoofing = spoofing;
        return outcome;
    }

    // 5.
    const std::string evidence_name = evidence->name;
    const auto importance = evidence->target.importance;
    if (!session.mark_discovered(evidence_id, now))
    {
        return failure(DiscoveryStatus::NotFound, "Evidence not found.");
    }

    DiscoveryOutcome outcome;
    outcome.status = DiscoveryStatus::Discovered;
    outcome.success = true;
    outcome.distance_m = validation.distance_to_target_m;
    outcome.bonus_points = bonus_points(importance, validation.distance_to_target_m);
    outcome.next_clue = next_clue(session);
    outcome.message = fmt::format("Discovered evidence \"{}\"!", evidence_name);
    outcome.validation = std::move(validation);
    outcome.spoofing = spoofing;

    session.discovery_bonus_total += outcome.bonus_points;

    WMK_INFO("Player {} discovered {} in game {} (+{} pts at {:.1f}m)",
             player_id, evidence_id, session.game_id, outcome.bonus_points, outcome.distance_m);
    return outcome;
}

std::shared_ptr<std::mutex> DiscoveryCoordinator::game_lock(const GameId& game_id)
{
    std::lock_guard lock(m_locks_mutex);
    auto& slot = m_game_locks[game_id];
    if (!slot)
    {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

// -----------------------------------------------------------------
// Scoring
// -----------------------------------------------------------------

i64 DiscoveryCoordinator::base_points(location::Importance importance)
{
    switch (importance)
    {
        case location::Importance::Critical:   return 50;
        case location::Importance::Important:  return 30;
        case location::Importance::Misleading: return 20;
        case location::Importance::Background: return 10;
    }
    return 10;
}

i64 DiscoveryCoordinator::distance_multiplier_percent(f64 distance_m)
{
    if (distance_m <= 10.0) return 150;
    if (distance_m <= 30.0) return 120;
    if (distance_m <= 50.0) return 100;
    return 80;
}

i64 DiscoveryCoordinator::bonus_points(location::Importance importance, f64 distance_m)
{
    // Integer arithmetic keeps e.g. 30 x 1.2 at exactly 36
    return base_points(importance) * distance_multiplier_percent(distance_m) / 100;
}

std::optional<std::string> DiscoveryCoordinator::next_clue(const GameSession& session)
{
    const auto remaining = session.remaining_evidence();

    if (remaining.empty())
    {
        return "All evidence has been found. Time to make your deduction.";
    }
    if (remaining.size() == 1)
    {
        const Evidence& last = *remaining.front();
        std::string clue = fmt::format("The last piece of evidence seems to be near {}.", last.poi_name);
        if (last.target.poi_type)
        {
            if (const char* hint = location::poi_type_hint(*last.target.poi_type))
            {
                clue += fmt::format(" {}", hint);
            }
        }
        return clue;
    }
    if (remaining.size() <= 3)
    {
        return fmt::format("Search around {}, {} for the remaining evidence.",
                           remaining[0]->poi_name, remaining[1]->poi_name);
    }
    return std::nullopt;
}

} // namespace waymark::game
