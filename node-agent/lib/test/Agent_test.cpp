/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for agent configuration and lifecycle
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sdnagent/Agent.h>
#include <sdnagent/test/BaseFixture.h>

#include <boost/test/unit_test.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/filesystem/fstream.hpp>

#include <sstream>
#include <stdexcept>

namespace sdnagent {

namespace fs = boost::filesystem;
namespace pt = boost::property_tree;
using std::string;

static pt::ptree parse(const string& json) {
    pt::ptree properties;
    std::stringstream ss(json);
    pt::read_json(ss, properties);
    return properties;
}

class AgentFixture {
public:
    AgentFixture() {
        // stay off the network in tests
        agent.setProperties(parse("{\"prometheus\":{\"enabled\":false}}"));
    }

    string sourceConfig() {
        return "{\"netnamespace-sources\":{\"filesystem\":[\"" +
            temp.temp_dir.string() + "\"]}}";
    }

    void write(const string& file, const string& name, uint32_t netid) {
        fs::ofstream os(temp.temp_dir / file);
        os << "{\"name\":\"" << name << "\",\"netid\":" << netid << "}"
           << std::endl;
    }

    TempGuard temp;
    Agent agent;
};

BOOST_AUTO_TEST_SUITE(Agent_test)

BOOST_FIXTURE_TEST_CASE(defaults, AgentFixture) {
    agent.setProperties(parse(sourceConfig()));
    agent.applyProperties();
    BOOST_CHECK_EQUAL("multitenant", agent.getIsolationMode());
    BOOST_CHECK(!agent.getIsolationPolicy().allowDuplicateNetID());
    BOOST_CHECK_EQUAL(400, agent.getLookupBackoff().getDuration().count());
    BOOST_CHECK_EQUAL(1.5, agent.getLookupBackoff().getFactor());
    BOOST_CHECK_EQUAL(6, agent.getLookupBackoff().getSteps());
    BOOST_CHECK_EQUAL(0, agent.getResyncInterval());
}

BOOST_FIXTURE_TEST_CASE(properties, AgentFixture) {
    agent.setProperties(parse(sourceConfig()));
    agent.setProperties(parse("{"
                              "\"isolation\":{\"mode\":\"networkpolicy\"},"
                              "\"vnid\":{"
                              "\"lookup-backoff\":{\"initial-delay\":100,"
                              "\"steps\":3},"
                              "\"resync-interval\":60}"
                              "}"));
    agent.applyProperties();
    BOOST_CHECK_EQUAL("networkpolicy", agent.getIsolationMode());
    BOOST_CHECK(agent.getIsolationPolicy().allowDuplicateNetID());
    BOOST_CHECK_EQUAL(100, agent.getLookupBackoff().getDuration().count());
    BOOST_CHECK_EQUAL(1.5, agent.getLookupBackoff().getFactor());
    BOOST_CHECK_EQUAL(3, agent.getLookupBackoff().getSteps());
    BOOST_CHECK_EQUAL(60, agent.getResyncInterval());
}

BOOST_FIXTURE_TEST_CASE(invalid, AgentFixture) {
    // no source
    BOOST_CHECK_THROW(agent.applyProperties(), std::runtime_error);

    agent.setProperties(parse("{\"netnamespace-sources\":{\"filesystem\":"
                              "[\"/tmp/a\",\"/tmp/b\"]}}"));
    BOOST_CHECK_THROW(agent.applyProperties(), std::runtime_error);

    Agent a2;
    a2.setProperties(parse(sourceConfig()));
    a2.setProperties(parse("{\"isolation\":{\"mode\":\"subnet\"}}"));
    BOOST_CHECK_THROW(a2.applyProperties(), std::runtime_error);

    Agent a3;
    a3.setProperties(parse(sourceConfig()));
    a3.setProperties(parse("{\"vnid\":{\"lookup-backoff\":{\"steps\":0}}}"));
    BOOST_CHECK_THROW(a3.applyProperties(), std::runtime_error);

    Agent a4;
    a4.setProperties(parse(sourceConfig()));
    a4.setProperties(parse("{\"vnid\":{\"lookup-backoff\":"
                           "{\"factor\":0.5}}}"));
    BOOST_CHECK_THROW(a4.applyProperties(), std::runtime_error);

    Agent a5;
    a5.setProperties(parse(sourceConfig()));
    a5.setProperties(parse("{\"vnid\":{\"lookup-backoff\":"
                           "{\"steps\":1000}}}"));
    BOOST_CHECK_THROW(a5.applyProperties(), std::runtime_error);

    Agent a6;
    a6.setProperties(parse(sourceConfig()));
    a6.setProperties(parse("{\"vnid\":{\"lookup-backoff\":"
                           "{\"initial-delay\":3600000}}}"));
    BOOST_CHECK_THROW(a6.applyProperties(), std::runtime_error);
}

BOOST_FIXTURE_TEST_CASE(lifecycle, AgentFixture) {
    write("a.netns", "team-a", 10);
    agent.setProperties(parse(sourceConfig()));
    agent.setProperties(parse("{\"vnid\":{\"lookup-backoff\":"
                              "{\"initial-delay\":1,\"steps\":3}}}"));
    agent.applyProperties();
    agent.start();

    VnidMap& vnidMap = agent.getVnidMap();
    BOOST_CHECK_EQUAL(10, vnidMap.getVnid("team-a").get());

    write("b.netns", "team-b", 11);
    WAIT_FOR(vnidMap.getVnid("team-b"), 1000);

    agent.stop();
}

BOOST_FIXTURE_TEST_CASE(start_fail, AgentFixture) {
    agent.setProperties(parse("{\"netnamespace-sources\":{\"filesystem\":"
                              "[\"" + (temp.temp_dir / "missing").string() +
                              "\"]}}"));
    agent.applyProperties();
    BOOST_CHECK_THROW(agent.start(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

}
