#include <gtest/gtest.h>

#include <map>

#include "facade.h"
#include "test_fixtures.h"

using namespace dispatch;
using namespace dispatch::testing_support;

namespace {

EngineConfig test_config() {
  EngineConfig cfg = default_config();
  cfg.notify_async = false;
  return cfg;
}

}  // namespace

class FacadeTest : public ::testing::Test {
 protected:
  FacadeTest() { world.roster->executors = plumbing_pool(); }

  Ticket registered(const std::string& id, const std::string& category, int urgency,
                    const std::string& zone = "") {
    Ticket t = make_ticket(id, category, urgency, zone);
    world.tickets->add(t);
    return t;
  }

  FakeWorld world;
  AssignmentFacade facade{test_config(), world.collaborators()};
};

TEST_F(FacadeTest, AssignsSpecialistCommitsAndNotifies) {
  const Ticket t = registered("T-1", "plumbing", 4, "A");
  const AssignmentDecision d = facade.assign_one(t, "dispatcher-1");

  EXPECT_EQ(d.executor_id, "plumber");
  EXPECT_NEAR(d.score, 0.875, 1e-6);
  EXPECT_EQ(d.service_mode, ServiceMode::Full);
  EXPECT_FALSE(d.fallback_used);
  EXPECT_TRUE(d.committed);
  EXPECT_GE(d.duration_ms, 0);

  ASSERT_EQ(world.store->count(), 1u);
  const auto& commit = world.store->commits[0];
  EXPECT_EQ(std::get<0>(commit), "T-1");
  EXPECT_EQ(std::get<1>(commit), "plumber");
  EXPECT_EQ(std::get<2>(commit).at("algorithm"), "basic");
  EXPECT_EQ(std::get<2>(commit).at("service_mode"), "full");
  EXPECT_EQ(std::get<2>(commit).at("fallback_used"), "false");

  ASSERT_EQ(world.notifier->sent.size(), 1u);
  EXPECT_EQ(world.notifier->sent[0].user_id, "plumber");
  EXPECT_EQ(world.notifier->sent[0].priority, "high");
  EXPECT_EQ(world.notifier->sent[0].message, "Ticket T-1 (plumbing, urgency 4, A) assigned to you");
}

TEST_F(FacadeTest, CanonicalTicketOverridesCallerCopy) {
  world.tickets->add(make_ticket("T-9", "electrical", 5));
  world.roster->executors.push_back(make_executor("sparky", {"electrical"}, 80, 0, 3));
  const AssignmentDecision d = facade.assign_one(make_ticket("T-9", "plumbing", 1), "dispatcher-1");
  EXPECT_EQ(d.executor_id, "sparky");
  EXPECT_EQ(world.notifier->sent.at(0).priority, "critical");
}

TEST_F(FacadeTest, EveryoneFullGivesNoCapacityWithoutSideEffects) {
  world.roster->executors = {make_executor("a", {"plumbing"}, 90, 5, 5),
                             make_executor("b", {"general"}, 90, 4, 4)};
  const AssignmentDecision d = facade.assign_one(registered("T-1", "plumbing", 3), "dispatcher-1");
  EXPECT_FALSE(d.assigned());
  EXPECT_EQ(d.reason, kReasonNoCapacity);
  EXPECT_FALSE(d.committed);
  EXPECT_EQ(world.store->count(), 0u);
  EXPECT_TRUE(world.notifier->sent.empty());
}

TEST_F(FacadeTest, TicketDataOutageFallsBackToStaticRoster) {
  facade.state().breakers().get(kDepTicketData).force_open();
  EXPECT_EQ(facade.service_mode(), ServiceMode::Degraded);

  const AssignmentDecision d = facade.assign_one(make_ticket("T-1", "plumbing", 4), "dispatcher-1");
  EXPECT_TRUE(d.assigned());
  EXPECT_EQ(d.executor_id.rfind("fallback-", 0), 0u) << d.executor_id;
  EXPECT_EQ(d.executor_id, "fallback-03");
  EXPECT_TRUE(d.fallback_used);
  EXPECT_EQ(d.service_mode, ServiceMode::Degraded);
  EXPECT_EQ(world.tickets->calls, 0);
  EXPECT_EQ(world.roster->calls, 0);
  EXPECT_EQ(std::get<2>(world.store->commits.at(0)).at("fallback_used"), "true");
}

TEST_F(FacadeTest, RepeatedTicketFailuresDegradeTheService) {
  world.tickets->fail = true;
  for (int i = 0; i < 3; ++i) {
    const AssignmentDecision d = facade.assign_one(make_ticket("T-" + std::to_string(i), "plumbing", 3),
                                                   "dispatcher-1");
    EXPECT_TRUE(d.fallback_used);
    EXPECT_TRUE(d.assigned());
  }
  EXPECT_EQ(facade.state().breakers().state_of(kDepTicketData), BreakerState::Open);
  EXPECT_EQ(facade.service_mode(), ServiceMode::Degraded);

  // The snapshot taken while FULL now serves the roster.
  facade.assign_one(make_ticket("T-x", "plumbing", 3), "dispatcher-1");
  EXPECT_EQ(world.roster->calls, 3);
  EXPECT_EQ(world.tickets->calls, 3);
}

TEST_F(FacadeTest, RecommendHasNoSideEffects) {
  const Ticket t = make_ticket("T-1", "plumbing", 4, "A");
  const auto first = facade.recommend(t, 0);
  const auto second = facade.recommend(t, 0);
  ASSERT_EQ(first.size(), 2u);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].executor_id, second[i].executor_id);
    EXPECT_DOUBLE_EQ(first[i].score, second[i].score);
  }
  EXPECT_EQ(first[0].executor_id, "plumber");
  EXPECT_EQ(facade.recommend(t, 1).size(), 1u);
  EXPECT_EQ(world.store->count(), 0u);
  EXPECT_TRUE(world.notifier->sent.empty());
  EXPECT_EQ(world.tickets->calls, 0);
}

TEST_F(FacadeTest, DeniedPermissionStopsEarly) {
  world.permissions->denied_users["intruder"] = true;
  const AssignmentDecision d = facade.assign_one(registered("T-1", "plumbing", 4), "intruder");
  EXPECT_FALSE(d.assigned());
  EXPECT_EQ(d.reason, kReasonPermissionDenied);
  EXPECT_FALSE(d.fallback_used);
  EXPECT_EQ(world.roster->calls, 0);
  EXPECT_EQ(world.store->count(), 0u);
}

TEST_F(FacadeTest, UnavailablePermissionFailsClosed) {
  world.permissions->fail = true;
  const AssignmentDecision d = facade.assign_one(registered("T-1", "plumbing", 4), "dispatcher-1");
  EXPECT_FALSE(d.assigned());
  EXPECT_EQ(d.reason, kReasonPermissionUnavailable);
  EXPECT_TRUE(d.fallback_used);
  EXPECT_EQ(world.store->count(), 0u);
}

TEST(FacadePermissions, FailOpenAssignsAndFlagsFallback) {
  FakeWorld world;
  world.roster->executors = plumbing_pool();
  world.tickets->add(make_ticket("T-1", "plumbing", 4));
  world.permissions->fail = true;
  EngineConfig cfg = test_config();
  cfg.permission_fail_open = true;
  AssignmentFacade facade(cfg, world.collaborators());

  const AssignmentDecision d = facade.assign_one(make_ticket("T-1", "plumbing", 4), "dispatcher-1");
  EXPECT_EQ(d.executor_id, "plumber");
  EXPECT_TRUE(d.fallback_used);
}

TEST_F(FacadeTest, BatchRespectsCapacityAndCommitsAssignedOnly) {
  world.roster->executors = {make_executor("a", {"plumbing"}, 80, 3, 5),
                             make_executor("b", {"general"}, 70, 0, 1)};
  std::vector<Ticket> tickets;
  for (int i = 0; i < 5; ++i) tickets.push_back(make_ticket("B-" + std::to_string(i), "plumbing", 1 + i));

  const auto decisions = facade.assign_batch(tickets);
  ASSERT_EQ(decisions.size(), tickets.size());
  std::map<std::string, int> per_executor;
  int assigned = 0;
  for (size_t i = 0; i < decisions.size(); ++i) {
    EXPECT_EQ(decisions[i].ticket_id, tickets[i].id);
    if (decisions[i].assigned()) {
      ++assigned;
      ++per_executor[decisions[i].executor_id];
      EXPECT_TRUE(decisions[i].committed);
    } else {
      EXPECT_EQ(decisions[i].reason, kReasonNoCapacity);
    }
  }
  EXPECT_EQ(assigned, 3);
  EXPECT_LE(per_executor["a"], 2);
  EXPECT_LE(per_executor["b"], 1);
  EXPECT_EQ(world.store->count(), 3u);
  EXPECT_EQ(world.notifier->sent.size(), 3u);
  // The two most urgent tickets are never the ones left over.
  EXPECT_TRUE(decisions[4].assigned());
  EXPECT_TRUE(decisions[3].assigned());
}

TEST_F(FacadeTest, BatchHonoursRequestedAlgorithm) {
  std::vector<Ticket> tickets = {make_ticket("B-1", "plumbing", 3), make_ticket("B-2", "plumbing", 2)};
  const auto decisions = facade.assign_batch(tickets, Algorithm::Population);
  ASSERT_EQ(decisions.size(), 2u);
  for (const auto& d : decisions) EXPECT_EQ(d.algorithm, Algorithm::Population);
  EXPECT_TRUE(facade.assign_batch({}).empty());
}

TEST(FacadeBudget, SlowRosterFetchCountsAgainstTheRequestBudget) {
  FakeWorld world;
  world.roster->executors = plumbing_pool();
  world.roster->delay_ms = 120;
  EngineConfig cfg = test_config();
  cfg.request_budget_ms = 50;
  AssignmentFacade facade(cfg, world.collaborators());

  const std::vector<Ticket> tickets = {make_ticket("B-1", "plumbing", 3),
                                       make_ticket("B-2", "plumbing", 2)};
  const auto decisions = facade.assign_batch(tickets, Algorithm::Annealing);
  ASSERT_EQ(decisions.size(), 2u);
  EXPECT_EQ(world.roster->calls, 1);
  for (const auto& d : decisions) {
    EXPECT_TRUE(d.budget_exhausted) << d.ticket_id;
    EXPECT_GE(d.duration_ms, 120);
  }
}

TEST_F(FacadeTest, EmergencyOverrideUsesRoundRobin) {
  facade.recommend(make_ticket("warm-up", "plumbing", 1), 0);   // FULL: snapshot the roster
  facade.set_service_mode(ServiceMode::Emergency, "drill");
  EXPECT_EQ(facade.service_mode(), ServiceMode::Emergency);

  const AssignmentDecision d1 = facade.assign_one(registered("T-1", "electrical", 2), "dispatcher-1");
  const AssignmentDecision d2 = facade.assign_one(registered("T-2", "electrical", 2), "dispatcher-1");
  EXPECT_EQ(d1.algorithm, Algorithm::RoundRobin);
  EXPECT_EQ(d1.executor_id, "plumber");
  EXPECT_EQ(d2.executor_id, "handyman");
  EXPECT_EQ(d1.service_mode, ServiceMode::Emergency);
  EXPECT_TRUE(d1.fallback_used);   // roster came from the snapshot

  ASSERT_TRUE(facade.health().override_info.has_value());
  facade.clear_service_mode_override();
  EXPECT_EQ(facade.service_mode(), ServiceMode::Full);
}

TEST_F(FacadeTest, FailedCommitIsReportedNotThrown) {
  world.store->fail = true;
  const AssignmentDecision d = facade.assign_one(registered("T-1", "plumbing", 4), "dispatcher-1");
  EXPECT_EQ(d.executor_id, "plumber");
  EXPECT_FALSE(d.committed);
}

TEST_F(FacadeTest, NotifierOutageDoesNotAffectTheDecision) {
  world.notifier->fail = true;
  const AssignmentDecision d = facade.assign_one(registered("T-1", "plumbing", 4), "dispatcher-1");
  EXPECT_EQ(d.executor_id, "plumber");
  EXPECT_TRUE(d.committed);
}

TEST_F(FacadeTest, HealthAndBreakerAdministration) {
  HealthReport h = facade.health();
  EXPECT_EQ(h.mode, ServiceMode::Full);
  EXPECT_TRUE(h.unhealthy.empty());
  EXPECT_EQ(h.fallback_data_version, 1);
  EXPECT_FALSE(h.override_info.has_value());

  const auto status = facade.circuit_breaker_status();
  EXPECT_EQ(status.size(), 5u);
  for (const char* dep : {kDepTicketData, kDepExecutorRoster, kDepPermissionCheck,
                          kDepNotification, kDepAssignmentCommit}) {
    EXPECT_EQ(status.count(dep), 1u) << dep;
  }
  EXPECT_EQ(status.at(kDepPermissionCheck).failure_threshold, 5);

  facade.state().breakers().get(kDepExecutorRoster).force_open();
  h = facade.health();
  EXPECT_EQ(h.mode, ServiceMode::Degraded);
  EXPECT_EQ(h.unhealthy, (std::vector<std::string>{kDepExecutorRoster}));

  EXPECT_TRUE(facade.reset_circuit_breaker(kDepExecutorRoster));
  EXPECT_FALSE(facade.reset_circuit_breaker("no-such-dependency"));
  EXPECT_EQ(facade.service_mode(), ServiceMode::Full);
}

TEST_F(FacadeTest, PlansRoutesForBatchDecisions) {
  world.roster->executors = {make_executor("a", {"general"}, 80, 0, 5, "Chilanzar"),
                             make_executor("b", {"general"}, 80, 0, 5, "Yunusabad")};
  const std::vector<Ticket> tickets = {make_ticket("R-1", "general", 3, "Sergeli"),
                                       make_ticket("R-2", "general", 3, "Olmazor"),
                                       make_ticket("R-3", "general", 3, "Yashnabad")};
  const auto decisions = facade.assign_batch(tickets, Algorithm::Greedy);
  const auto plans = facade.plan_routes(decisions, tickets);
  size_t routed = 0;
  for (const auto& p : plans) {
    routed += p.ticket_ids.size();
    EXPECT_FALSE(p.home_zone.empty());
    EXPECT_GE(p.total_km, 0.0);
  }
  EXPECT_EQ(routed, 3u);
}

TEST_F(FacadeTest, ClustersAndZoneDemand) {
  const std::vector<Ticket> tickets = {make_ticket("Z-1", "general", 3, "Sergeli"),
                                       make_ticket("Z-2", "general", 3, "Chilanzar"),
                                       make_ticket("Z-3", "general", 3, "Chilanzar")};
  const auto clusters = facade.cluster_tickets(tickets);
  ASSERT_EQ(clusters.size(), 2u);
  EXPECT_EQ(clusters[0].zone, "Chilanzar");
  EXPECT_EQ(clusters[0].ticket_ids.size(), 2u);
  EXPECT_EQ(world.roster->calls, 0);

  const auto demand = facade.zone_demand(tickets);
  EXPECT_EQ(world.roster->calls, 1);
  ASSERT_EQ(demand.size(), 10u);
  EXPECT_EQ(demand[0].zone, "Chilanzar");
  EXPECT_EQ(demand[0].suggested_executors, 1);   // two executors on the roster
  EXPECT_EQ(demand[0].nearby,
            (std::vector<std::string>{"Uchtepa", "Yashnabad", "Shaykhantakhur"}));
  EXPECT_EQ(demand[1].zone, "Sergeli");
  EXPECT_TRUE(demand[1].nearby.empty());
  EXPECT_EQ(world.store->count(), 0u);
}

TEST(FacadeSharing, StateIsVisibleAcrossFacades) {
  FakeWorld a_world, b_world;
  auto state = std::make_shared<ResilienceState>(default_breakers());
  AssignmentFacade a(test_config(), a_world.collaborators(), state);
  AssignmentFacade b(test_config(), b_world.collaborators(), state);

  a.set_service_mode(ServiceMode::Minimal, "maintenance");
  EXPECT_EQ(b.service_mode(), ServiceMode::Minimal);
  b.clear_service_mode_override();
  EXPECT_EQ(a.service_mode(), ServiceMode::Full);
}

TEST(FacadeConstruction, RejectsMissingCollaborator) {
  FakeWorld world;
  Collaborators c = world.collaborators();
  c.store = nullptr;
  EXPECT_THROW(AssignmentFacade f(test_config(), c), InvalidConfiguration);
}

TEST(FacadeConstruction, RejectsInvalidWeights) {
  FakeWorld world;
  EngineConfig cfg = test_config();
  cfg.scoring.weights = ScoringWeights{0.5, 0.5, 0.5, 0.5, 0.0};
  EXPECT_THROW(AssignmentFacade f(cfg, world.collaborators()), InvalidConfiguration);
}

TEST(NotificationPriority, FollowsUrgency) {
  EXPECT_STREQ(notification_priority(5), "critical");
  EXPECT_STREQ(notification_priority(4), "high");
  EXPECT_STREQ(notification_priority(3), "normal");
  EXPECT_STREQ(notification_priority(1), "normal");
}
