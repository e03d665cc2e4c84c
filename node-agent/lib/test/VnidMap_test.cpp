/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for the VNID map
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/test/BaseFixture.h>
#include <sdnagent/VnidMap.h>
#include <sdnagent/MultitenantIsolation.h>
#include <sdnagent/NetworkPolicyIsolation.h>

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace sdnagent {

using std::string;
using std::unordered_set;

class NetworkPolicyFixture : public BaseFixture {
public:
    NetworkPolicyFixture() : BaseFixture(true) {}
};

/**
 * Wires a VNID map to one of the real isolation policies
 */
template <typename Policy>
class PolicyFixture {
public:
    PolicyFixture() : vnidMap(policy, source) {
        vnidMap.setLookupBackoff(Backoff(std::chrono::milliseconds(1),
                                         1.5, 4));
    }

    ~PolicyFixture() {
        vnidMap.stop();
    }

    MockNetNamespaceSource source;
    Policy policy;
    VnidMap vnidMap;
};

typedef PolicyFixture<MultitenantIsolation> MultitenantFixture;
typedef PolicyFixture<NetworkPolicyIsolation> PolicyIsolationFixture;

static NetNamespace mkNetns(const string& name, uint32_t vnid,
                            bool mc = false) {
    NetNamespace netns(name, vnid);
    netns.setMulticastEnabled(mc);
    return netns;
}

static unordered_set<string> getNamespaces(VnidMap& vnidMap,
                                           uint32_t vnid) {
    unordered_set<string> names;
    vnidMap.getNamespaces(vnid, names);
    return names;
}

BOOST_AUTO_TEST_SUITE(VnidMap_test)

BOOST_FIXTURE_TEST_CASE(bootstrap, BaseFixture) {
    source.put(mkNetns("team-a", 10));
    source.put(mkNetns("team-b", 11, true));
    source.put(mkNetns("default", GLOBAL_VNID));
    vnidMap.start();

    BOOST_CHECK(source.isWatched());
    BOOST_CHECK_EQUAL(3, vnidMap.getNetNamespaceCount());
    BOOST_CHECK_EQUAL(10, vnidMap.getVnid("team-a").get());
    BOOST_CHECK_EQUAL(11, vnidMap.getVnid("team-b").get());
    BOOST_CHECK_EQUAL(GLOBAL_VNID, vnidMap.getVnid("default").get());
    BOOST_CHECK(vnidMap.getMulticastEnabled(11));
    BOOST_CHECK(!vnidMap.getMulticastEnabled(10));

    // replaying the listed bindings changes nothing
    source.add(mkNetns("team-a", 10));
    BOOST_CHECK(policy.getCalls().empty());

    std::vector<std::vector<NetNamespace> > syncs = policy.getSyncs();
    BOOST_REQUIRE_EQUAL(1, syncs.size());
    BOOST_CHECK_EQUAL(3, syncs[0].size());
}

BOOST_FIXTURE_TEST_CASE(bootstrap_multitenant, MultitenantFixture) {
    source.put(mkNetns("team-a", 10));
    source.put(mkNetns("team-b", 11));
    source.put(mkNetns("default", GLOBAL_VNID));
    source.put(mkNetns("kube-system", GLOBAL_VNID));
    vnidMap.start();

    // the watch replays what was listed
    source.add(mkNetns("team-a", 10));
    source.add(mkNetns("team-b", 11));
    BOOST_CHECK(policy.isVnidInUse(10));
    BOOST_CHECK_EQUAL(1, policy.getVnidRefCount(10));
    BOOST_CHECK_EQUAL(1, policy.getVnidRefCount(11));
    BOOST_CHECK_EQUAL(2, policy.getVnidRefCount(GLOBAL_VNID));

    source.remove(mkNetns("team-a", 10));
    BOOST_CHECK(!policy.isVnidInUse(10));

    source.update(mkNetns("team-b", 12));
    BOOST_CHECK_EQUAL(0, policy.getVnidRefCount(11));
    BOOST_CHECK_EQUAL(1, policy.getVnidRefCount(12));
}

BOOST_FIXTURE_TEST_CASE(bootstrap_networkpolicy, PolicyIsolationFixture) {
    source.put(mkNetns("nsA", 5));
    source.put(mkNetns("nsB", 5));
    vnidMap.start();
    source.add(mkNetns("nsA", 5));

    unordered_set<string> names;
    policy.getPolicyNamespaces(5, names);
    BOOST_CHECK_EQUAL(2, names.size());

    source.remove(mkNetns("nsB", 5));
    names.clear();
    policy.getPolicyNamespaces(5, names);
    BOOST_CHECK_EQUAL(1, names.size());
    BOOST_CHECK(names.count("nsA"));
}

BOOST_FIXTURE_TEST_CASE(bootstrap_fail, BaseFixture) {
    source.put(mkNetns("team-a", 10));
    source.failList = true;
    BOOST_CHECK_THROW(vnidMap.start(), std::runtime_error);
    BOOST_CHECK(!source.isWatched());
    BOOST_CHECK_EQUAL(0, vnidMap.getNetNamespaceCount());
}

BOOST_FIXTURE_TEST_CASE(index, BaseFixture) {
    vnidMap.start();
    source.add(mkNetns("a", 5));
    source.add(mkNetns("b", 6));

    BOOST_CHECK_EQUAL(5, vnidMap.getVnid("a").get());
    BOOST_CHECK(getNamespaces(vnidMap, 5).count("a"));

    source.update(mkNetns("a", 7));
    BOOST_CHECK_EQUAL(7, vnidMap.getVnid("a").get());
    BOOST_CHECK(getNamespaces(vnidMap, 5).empty());
    BOOST_CHECK(getNamespaces(vnidMap, 7).count("a"));
    BOOST_CHECK(!vnidMap.getMulticastEnabled(5));

    std::vector<MockIsolationPolicy::Call> calls = policy.getCalls();
    BOOST_REQUIRE_EQUAL(3, calls.size());
    BOOST_CHECK_EQUAL("add", calls[0].op);
    BOOST_CHECK_EQUAL("add", calls[1].op);
    BOOST_CHECK_EQUAL("update", calls[2].op);
    BOOST_CHECK_EQUAL(7, calls[2].netID);
    BOOST_CHECK_EQUAL(5, calls[2].oldNetID);

    source.remove(mkNetns("a", 7));
    BOOST_CHECK(!vnidMap.getVnid("a"));
    BOOST_CHECK(getNamespaces(vnidMap, 7).empty());
    BOOST_CHECK_EQUAL(1, vnidMap.getNetNamespaceCount());
}

BOOST_FIXTURE_TEST_CASE(idempotent, BaseFixture) {
    vnidMap.start();
    source.add(mkNetns("a", 5));
    source.update(mkNetns("a", 5));
    source.add(mkNetns("a", 5));
    BOOST_CHECK_EQUAL(1, policy.getCalls().size());

    // a multicast flip alone is a change
    source.update(mkNetns("a", 5, true));
    std::vector<MockIsolationPolicy::Call> calls = policy.getCalls();
    BOOST_REQUIRE_EQUAL(2, calls.size());
    BOOST_CHECK_EQUAL("update", calls[1].op);
    BOOST_CHECK_EQUAL(5, calls[1].oldNetID);
    BOOST_CHECK(vnidMap.getMulticastEnabled(5));
}

BOOST_FIXTURE_TEST_CASE(update_unknown_is_add, BaseFixture) {
    vnidMap.start();
    source.update(mkNetns("a", 5));
    std::vector<MockIsolationPolicy::Call> calls = policy.getCalls();
    BOOST_REQUIRE_EQUAL(1, calls.size());
    BOOST_CHECK_EQUAL("add", calls[0].op);
}

BOOST_FIXTURE_TEST_CASE(multicast_group, NetworkPolicyFixture) {
    vnidMap.start();
    BOOST_CHECK(!vnidMap.getMulticastEnabled(5));

    source.add(mkNetns("a", 5, true));
    BOOST_CHECK(vnidMap.getMulticastEnabled(5));

    source.add(mkNetns("b", 5, false));
    BOOST_CHECK(!vnidMap.getMulticastEnabled(5));

    source.update(mkNetns("b", 5, true));
    BOOST_CHECK(vnidMap.getMulticastEnabled(5));
    BOOST_CHECK_EQUAL(2, getNamespaces(vnidMap, 5).size());
}

BOOST_FIXTURE_TEST_CASE(conflict, BaseFixture) {
    vnidMap.start();
    source.add(mkNetns("nsA", 5));
    source.add(mkNetns("nsB", 5));

    BOOST_CHECK_EQUAL(5, vnidMap.getVnid("nsA").get());
    BOOST_CHECK(!vnidMap.getVnid("nsB"));
    unordered_set<string> names = getNamespaces(vnidMap, 5);
    BOOST_CHECK_EQUAL(1, names.size());
    BOOST_CHECK(names.count("nsA"));
    BOOST_CHECK_EQUAL(1, vnidMap.getConflictCount());
    BOOST_CHECK_EQUAL(1, policy.getCalls().size());

    // an existing binding that tries to move onto a taken VNID is
    // left where it was
    source.add(mkNetns("nsC", 6));
    source.update(mkNetns("nsC", 5));
    BOOST_CHECK_EQUAL(6, vnidMap.getVnid("nsC").get());
    BOOST_CHECK_EQUAL(2, vnidMap.getConflictCount());
}

BOOST_FIXTURE_TEST_CASE(conflict_allowed, NetworkPolicyFixture) {
    vnidMap.start();
    source.add(mkNetns("nsA", 5));
    source.add(mkNetns("nsB", 5));
    BOOST_CHECK_EQUAL(2, getNamespaces(vnidMap, 5).size());
    BOOST_CHECK_EQUAL(0, vnidMap.getConflictCount());
}

BOOST_FIXTURE_TEST_CASE(global_vnid, BaseFixture) {
    vnidMap.start();
    source.add(mkNetns("default", GLOBAL_VNID));
    source.add(mkNetns("kube-system", GLOBAL_VNID));
    BOOST_CHECK_EQUAL(2, getNamespaces(vnidMap, GLOBAL_VNID).size());
    BOOST_CHECK_EQUAL(0, vnidMap.getConflictCount());
}

BOOST_FIXTURE_TEST_CASE(delete_order, BaseFixture) {
    vnidMap.start();
    source.add(mkNetns("a", 5));

    bool sawBinding = true;
    policy.onDelete = [this, &sawBinding](const NetNamespace&) {
        sawBinding = vnidMap.getVnid("a") ||
            !getNamespaces(vnidMap, 5).empty();
    };
    source.remove(mkNetns("a", 5));
    BOOST_CHECK(!sawBinding);

    std::vector<MockIsolationPolicy::Call> calls = policy.getCalls();
    BOOST_REQUIRE_EQUAL(2, calls.size());
    BOOST_CHECK_EQUAL("delete", calls[1].op);
}

BOOST_FIXTURE_TEST_CASE(delete_after_dropped_update, BaseFixture) {
    vnidMap.start();
    source.add(mkNetns("nsA", 5));
    source.add(mkNetns("nsB", 6));
    // dropped, nsB stays on 6
    source.update(mkNetns("nsB", 5));
    BOOST_CHECK_EQUAL(6, vnidMap.getVnid("nsB").get());

    // the source only knows the binding it last reported
    source.remove(mkNetns("nsB", 5));
    BOOST_CHECK(!vnidMap.getVnid("nsB"));
    std::vector<MockIsolationPolicy::Call> calls = policy.getCalls();
    BOOST_REQUIRE_EQUAL(3, calls.size());
    BOOST_CHECK_EQUAL("delete", calls[2].op);
    BOOST_CHECK_EQUAL("nsB", calls[2].netName);
    BOOST_CHECK_EQUAL(6, calls[2].netID);
}

BOOST_FIXTURE_TEST_CASE(delete_after_dropped_update_multitenant,
                        MultitenantFixture) {
    vnidMap.start();
    source.add(mkNetns("nsA", 5));
    source.add(mkNetns("nsB", 6));
    source.update(mkNetns("nsB", 5));
    source.remove(mkNetns("nsB", 5));

    BOOST_CHECK_EQUAL(1, policy.getVnidRefCount(5));
    BOOST_CHECK_EQUAL(0, policy.getVnidRefCount(6));
    BOOST_CHECK(getNamespaces(vnidMap, 5).count("nsA"));
}

BOOST_FIXTURE_TEST_CASE(delete_unknown, BaseFixture) {
    vnidMap.start();
    source.remove(mkNetns("ghost", 9));
    BOOST_CHECK(policy.getCalls().empty());
    BOOST_CHECK_EQUAL(0, vnidMap.getNetNamespaceCount());
}

BOOST_FIXTURE_TEST_CASE(wait_present, BaseFixture) {
    source.put(mkNetns("team-a", 42));
    vnidMap.start();
    BOOST_CHECK_EQUAL(42, vnidMap.waitAndGetVnid("team-a"));
    BOOST_CHECK_EQUAL(0, vnidMap.getVnidNotFoundErrors());
    BOOST_CHECK_EQUAL(0, source.getCalls.load());
}

BOOST_FIXTURE_TEST_CASE(wait_lagging_watch, BaseFixture) {
    vnidMap.start();
    // in the source but the watch event has not arrived
    source.put(mkNetns("team-a", 42));

    BOOST_CHECK_EQUAL(42, vnidMap.waitAndGetVnid("team-a"));
    BOOST_CHECK_EQUAL(1, vnidMap.getVnidNotFoundErrors());
    BOOST_CHECK_EQUAL(1, source.getCalls.load());
    BOOST_CHECK_EQUAL(42, vnidMap.getVnid("team-a").get());

    std::vector<MockIsolationPolicy::Call> calls = policy.getCalls();
    BOOST_REQUIRE_EQUAL(1, calls.size());
    BOOST_CHECK_EQUAL("add", calls[0].op);

    // the late watch event is now a no-op
    source.add(mkNetns("team-a", 42));
    BOOST_CHECK_EQUAL(1, policy.getCalls().size());
}

BOOST_FIXTURE_TEST_CASE(wait_event_during_backoff, BaseFixture) {
    vnidMap.setLookupBackoff(Backoff(std::chrono::milliseconds(10),
                                     1.5, 10));
    vnidMap.start();

    std::thread writer([this]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            source.add(mkNetns("team-b", 77));
        });
    uint32_t vnid = vnidMap.waitAndGetVnid("team-b");
    writer.join();

    BOOST_CHECK_EQUAL(77, vnid);
    BOOST_CHECK_EQUAL(0, vnidMap.getVnidNotFoundErrors());
    BOOST_CHECK_EQUAL(0, source.getCalls.load());
}

BOOST_FIXTURE_TEST_CASE(wait_not_found, BaseFixture) {
    vnidMap.start();
    BOOST_CHECK_THROW(vnidMap.waitAndGetVnid("missing"),
                      VnidNotFoundException);
    BOOST_CHECK_EQUAL(1, vnidMap.getVnidNotFoundErrors());

    source.put(mkNetns("team-c", 3));
    source.failGet = true;
    try {
        vnidMap.waitAndGetVnid("team-c");
        BOOST_FAIL("expected VnidNotFoundException");
    } catch (const VnidNotFoundException& e) {
        BOOST_CHECK_EQUAL("team-c", e.getNetName());
        BOOST_CHECK(string(e.what()).find("team-c") != string::npos);
    }
    BOOST_CHECK_EQUAL(2, vnidMap.getVnidNotFoundErrors());
    BOOST_CHECK(!vnidMap.getVnid("team-c"));
}

BOOST_FIXTURE_TEST_CASE(wait_fallback_duplicate, BaseFixture) {
    vnidMap.start();
    source.add(mkNetns("nsA", 5));
    source.put(mkNetns("nsB", 5));

    // the source answer is returned even though the map keeps the
    // earlier owner of the VNID
    BOOST_CHECK_EQUAL(5, vnidMap.waitAndGetVnid("nsB"));
    BOOST_CHECK(!vnidMap.getVnid("nsB"));
    BOOST_CHECK_EQUAL(1, vnidMap.getConflictCount());
}

BOOST_FIXTURE_TEST_CASE(resync, BaseFixture) {
    vnidMap.start();
    source.add(mkNetns("nsA", 5));
    source.add(mkNetns("nsB", 5));
    BOOST_CHECK(!vnidMap.getVnid("nsB"));

    // nsA goes away but its delete event is lost
    source.erase("nsA");
    // a binding appears without an event
    source.put(mkNetns("nsC", 8, true));

    vnidMap.resync();
    BOOST_CHECK(!vnidMap.getVnid("nsA"));
    BOOST_CHECK_EQUAL(5, vnidMap.getVnid("nsB").get());
    BOOST_CHECK_EQUAL(8, vnidMap.getVnid("nsC").get());
    BOOST_CHECK(vnidMap.getMulticastEnabled(8));

    // a second pass is a no-op
    policy.clearCalls();
    vnidMap.resync();
    BOOST_CHECK(policy.getCalls().empty());
    BOOST_CHECK_EQUAL(2, vnidMap.getNetNamespaceCount());
    BOOST_CHECK_EQUAL(1, vnidMap.getConflictCount());
}

BOOST_FIXTURE_TEST_CASE(resync_order, BaseFixture) {
    vnidMap.start();
    source.add(mkNetns("nsA", 5));
    source.erase("nsA");
    source.put(mkNetns("nsB", 5));
    policy.clearCalls();

    vnidMap.resync();
    std::vector<MockIsolationPolicy::Call> calls = policy.getCalls();
    BOOST_REQUIRE_EQUAL(2, calls.size());
    BOOST_CHECK_EQUAL("delete", calls[0].op);
    BOOST_CHECK_EQUAL("nsA", calls[0].netName);
    BOOST_CHECK_EQUAL("add", calls[1].op);
    BOOST_CHECK_EQUAL("nsB", calls[1].netName);
    BOOST_CHECK_EQUAL(0, vnidMap.getConflictCount());
}

BOOST_FIXTURE_TEST_CASE(resync_policy_error, BaseFixture) {
    source.put(mkNetns("stale", 2));
    vnidMap.start();
    source.erase("stale");
    source.put(mkNetns("bad", 3));
    source.put(mkNetns("good", 4));

    policy.onDelete = [](const NetNamespace&) {
        throw std::runtime_error("delete failed");
    };
    policy.onAdd = [](const NetNamespace& netns) {
        if (netns.getNetName() == "bad")
            throw std::runtime_error("add failed");
    };
    BOOST_CHECK_NO_THROW(vnidMap.resync());

    BOOST_CHECK(!vnidMap.getVnid("stale"));
    BOOST_CHECK_EQUAL(4, vnidMap.getVnid("good").get());
    std::vector<MockIsolationPolicy::Call> calls = policy.getCalls();
    BOOST_REQUIRE_EQUAL(1, calls.size());
    BOOST_CHECK_EQUAL("add", calls[0].op);
    BOOST_CHECK_EQUAL("good", calls[0].netName);
}

BOOST_FIXTURE_TEST_CASE(resync_fail, BaseFixture) {
    source.put(mkNetns("a", 1));
    vnidMap.start();
    source.failList = true;
    BOOST_CHECK_THROW(vnidMap.resync(), std::runtime_error);
    BOOST_CHECK_EQUAL(1, vnidMap.getVnid("a").get());
}

BOOST_FIXTURE_TEST_CASE(stop, BaseFixture) {
    vnidMap.start();
    vnidMap.stop();
    BOOST_CHECK(!source.isWatched());
    source.add(mkNetns("a", 1));
    BOOST_CHECK(!vnidMap.getVnid("a"));
}

// Namespace nsI only ever binds to VNID 20+I%4 or to VNID 30+I%4,
// and never with multicast on for the latter
static bool vnidAllowed(const string& name, uint32_t vnid) {
    uint32_t slot = (name[2] - '0') % 4;
    return vnid == 20 + slot || vnid == 30 + slot;
}

BOOST_FIXTURE_TEST_CASE(concurrent_readers, PolicyIsolationFixture) {
    const size_t NS_COUNT = 8;
    const std::vector<uint32_t> vnids = {20, 21, 22, 23, 30, 31, 32, 33};
    vnidMap.start();

    std::atomic<bool> done(false);
    std::atomic<int> errors(0);
    std::atomic<long> reads(0);

    auto reader = [&]() {
        while (!done) {
            for (uint32_t vnid : vnids) {
                for (const string& name : getNamespaces(vnidMap, vnid)) {
                    if (!vnidAllowed(name, vnid)) errors += 1;
                }
                if (vnid >= 30 && vnidMap.getMulticastEnabled(vnid))
                    errors += 1;
            }
            for (size_t i = 0; i < NS_COUNT; ++i) {
                string name = "ns" + std::to_string(i);
                boost::optional<uint32_t> id = vnidMap.getVnid(name);
                if (id && !vnidAllowed(name, id.get())) errors += 1;
            }
            if (vnidMap.getNetNamespaceCount() > NS_COUNT) errors += 1;
            reads += 1;
        }
    };
    std::vector<std::thread> readers;
    for (int i = 0; i < 3; ++i)
        readers.push_back(std::thread(reader));

    std::minstd_rand rng(42);
    std::map<string, NetNamespace> bound;
    for (int op = 0; op < 3000; ++op) {
        int i = rng() % NS_COUNT;
        string name = "ns" + std::to_string(i);
        uint32_t slot = i % 4;
        switch (rng() % 4) {
        case 0:
            source.add(mkNetns(name, 20 + slot, true));
            bound[name] = mkNetns(name, 20 + slot, true);
            break;
        case 1:
            source.update(mkNetns(name, 30 + slot, false));
            bound[name] = mkNetns(name, 30 + slot, false);
            break;
        case 2:
            if (bound.count(name)) {
                // multicast off on the shared group
                NetNamespace netns = bound[name];
                netns.setMulticastEnabled(false);
                source.update(netns);
                bound[name] = netns;
            }
            break;
        default:
            if (bound.count(name)) {
                source.remove(bound[name]);
                bound.erase(name);
            }
            break;
        }
    }
    done = true;
    for (std::thread& t : readers)
        t.join();

    BOOST_CHECK_EQUAL(0, errors.load());
    BOOST_CHECK(reads.load() > 0);

    // quiescent: both directions of the index agree with the source
    BOOST_CHECK_EQUAL(bound.size(), vnidMap.getNetNamespaceCount());
    for (const auto& b : bound) {
        boost::optional<uint32_t> id = vnidMap.getVnid(b.first);
        BOOST_REQUIRE(id);
        BOOST_CHECK_EQUAL(b.second.getNetID(), id.get());
        BOOST_CHECK(getNamespaces(vnidMap, b.second.getNetID())
                    .count(b.first));
    }
    for (uint32_t vnid : vnids) {
        unordered_set<string> names = getNamespaces(vnidMap, vnid);
        bool mc = !names.empty();
        for (const string& name : names) {
            BOOST_REQUIRE(bound.count(name));
            BOOST_CHECK_EQUAL(vnid, bound[name].getNetID());
            mc = mc && bound[name].isMulticastEnabled();
        }
        BOOST_CHECK_EQUAL(mc, vnidMap.getMulticastEnabled(vnid));

        unordered_set<string> policyNames;
        policy.getPolicyNamespaces(vnid, policyNames);
        BOOST_CHECK(names == policyNames);
    }
}

BOOST_AUTO_TEST_SUITE_END()

}
