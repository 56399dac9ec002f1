#pragma once

// ============================================================================
// Progression Achievement System - Umbrella Header
// ============================================================================
//
// Counter-driven achievements with conjunctive requirements and an explicit
// Locked -> Unlocked -> Claimed lifecycle.
//
// Quick Start:
// ------------
// 1. Define achievements:
//    AchievementRegistry registry;
//    achievement()
//        .id("first_level")
//        .name("First Steps")
//        .category(AchievementCategory::Progression)
//        .require("levels_completed", 1)
//        .coins(100)
//        .gems(10)
//        .register_achievement(registry);
//
// 2. Evaluate against counters:
//    AchievementManager manager(registry);
//    counters.increment("levels_completed", 1);
//    auto unlocked = manager.evaluate_dependents("levels_completed", counters, now);
//
// 3. Claim rewards:
//    if (manager.begin_claim("first_level")) { /* grant, then */ manager.complete_grant("first_level"); }
//
// ============================================================================

#include <progression/achievements/achievement_definition.hpp>
#include <progression/achievements/requirement_evaluator.hpp>
#include <progression/achievements/achievement_events.hpp>
#include <progression/achievements/achievement_manager.hpp>
