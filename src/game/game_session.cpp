/// @file game_session.cpp
/// @brief Game session state transitions and queries.

#include "game/game_session.hpp"

#include "geo/geo_math.hpp"

#include <algorithm>

namespace waymark::game
{

const char* game_status_name(GameStatus status)
{
    switch (status)
    {
        case GameStatus::Active:    return "active";
        case GameStatus::Completed: return "completed";
        case GameStatus::Abandoned: return "abandoned";
        case GameStatus::Expired:   return "expired";
    }
    return "unknown";
}

bool GameSession::is_discovered(const EvidenceId& evidence_id) const
{
    return std::find(discovered_evidence.begin(), discovered_evidence.end(), evidence_id)
        != discovered_evidence.end();
}

const Evidence* GameSession::find_evidence(const EvidenceId& evidence_id) const
{
    const auto it = std::find_if(evidence_list.begin(), evidence_list.end(),
                                 [&](const Evidence& e) { return e.evidence_id == evidence_id; });
    return it == evidence_list.end() ? nullptr : &*it;
}

Evidence* GameSession::find_evidence(const EvidenceId& evidence_id)
{
    const auto it = std::find_if(evidence_list.begin(), evidence_list.end(),
                                 [&](const Evidence& e) { return e.evidence_id == evidence_id; });
    return it == evidence_list.end() ? nullptr : &*it;
}

bool GameSession::mark_discovered(const EvidenceId& evidence_id, Timestamp when)
{
    if (is_discovered(evidence_id))
    {
        return false;
    }

    Evidence* evidence = find_evidence(evidence_id);
    if (evidence == nullptr)
    {
        return false;
    }

    discovered_evidence.push_back(evidence_id);
    if (!evidence->discovered_at)
    {
        evidence->discovered_at = when;
    }
    return true;
}

std::vector<const Evidence*> GameSession::remaining_evidence() const
{
    std::vector<const Evidence*> remaining;
    for (const auto& evidence : evidence_list)
    {
        if (!is_discovered(evidence.evidence_id))
        {
            remaining.push_back(&evidence);
        }
    }
    return remaining;
}

std::vector<const Evidence*> GameSession::nearby_evidence(const geo::Coordinate& position) const
{
    std::vector<const Evidence*> nearby;
    for (const Evidence* evidence : remaining_evidence())
    {
        if (geo::GeoMath::distance(position, evidence->target.coordinate) <= discovery_radius_m)
        {
            nearby.push_back(evidence);
        }
    }
    return nearby;
}

GameProgress GameSession::progress() const
{
    GameProgress p;
    p.total_evidence = evidence_list.size();
    p.discovered_count = discovered_evidence.size();
    p.completion_rate = p.total_evidence == 0
        ? 0.0
        : static_cast<f64>(p.discovered_count) / static_cast<f64>(p.total_evidence);
    return p;
}

} // namespace waymark::game
