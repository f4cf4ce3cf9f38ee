// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "bridge_planner.h"

#include "bridge_test_fixture.h"

#include <catch2/catch_test_macros.hpp>

using namespace vbridge;

namespace vbridge {

class PlannerTestFixture : public BridgeTestFixture {
  protected:
    BridgePlanner planner{inspector};
    RunOptions run;

    BridgeOptions options_for(const std::string& slave) {
        BridgeOptions o;
        o.slave_interface = slave;
        return o;
    }

    BridgeResult plan_result(const BridgeOptions& o) {
        BridgePlan plan;
        return planner.plan(o, run, plan).result;
    }
};

} // namespace vbridge

TEST_CASE("Port connection name", "[bridge_planner]") {
    REQUIRE(port_connection_name("c-mybr0", "eth0") == "c-mybr0-port-eth0");
}

TEST_CASE_METHOD(PlannerTestFixture, "Planner range validation", "[bridge_planner][validation]") {
    add_device("eth0", device_type::ETHERNET, device_state::ACTIVATED, "52:54:00:12:34:56");
    BridgeOptions o = options_for("eth0");

    SECTION("STP priority boundaries") {
        o.stp_priority = 0;
        REQUIRE(plan_result(o) == BridgeResult::SUCCESS);
        o.stp_priority = 65535;
        REQUIRE(plan_result(o) == BridgeResult::SUCCESS);
        o.stp_priority = -1;
        REQUIRE(plan_result(o) == BridgeResult::INVALID_PARAMETER);
        o.stp_priority = 65536;
        REQUIRE(plan_result(o) == BridgeResult::INVALID_PARAMETER);
    }

    SECTION("forward delay boundaries") {
        o.forward_delay = 0;
        REQUIRE(plan_result(o) == BridgeResult::SUCCESS);
        o.forward_delay = 30;
        REQUIRE(plan_result(o) == BridgeResult::SUCCESS);
        o.forward_delay = 31;
        REQUIRE(plan_result(o) == BridgeResult::INVALID_PARAMETER);
        o.forward_delay = -5;
        REQUIRE(plan_result(o) == BridgeResult::INVALID_PARAMETER);
    }

    SECTION("VLAN PVID boundaries") {
        o.vlan_default_pvid = 1;
        REQUIRE(plan_result(o) == BridgeResult::SUCCESS);
        o.vlan_default_pvid = 4094;
        REQUIRE(plan_result(o) == BridgeResult::SUCCESS);
        o.vlan_default_pvid = 0;
        REQUIRE(plan_result(o) == BridgeResult::INVALID_PARAMETER);
        o.vlan_default_pvid = 4095;
        REQUIRE(plan_result(o) == BridgeResult::INVALID_PARAMETER);
    }

    SECTION("error names the offending field") {
        o.forward_delay = 99;
        BridgePlan plan;
        BridgeError err = planner.plan(o, run, plan);
        REQUIRE(err.user_msg.find("fdelay") != std::string::npos);
    }

    SECTION("empty names") {
        o.conn_name.clear();
        REQUIRE(plan_result(o) == BridgeResult::INVALID_PARAMETER);
        o.conn_name = "c-mybr0";
        o.bridge_ifname.clear();
        REQUIRE(plan_result(o) == BridgeResult::INVALID_PARAMETER);
    }

    SECTION("validation does not touch the service") {
        o.stp_priority = 70000;
        backend.set_service_available(false);
        REQUIRE(plan_result(o) == BridgeResult::INVALID_PARAMETER);
    }
}

TEST_CASE_METHOD(PlannerTestFixture, "Planner automatic slave selection",
                 "[bridge_planner][auto]") {
    BridgeOptions o;

    SECTION("activated Wi-Fi is used when no Ethernet is activated") {
        add_device("eth0", device_type::ETHERNET, device_state::DISCONNECTED);
        add_device("wlan0", device_type::WIFI, device_state::ACTIVATED, "02:00:00:aa:bb:cc");

        BridgePlan plan;
        REQUIRE(planner.plan(o, run, plan).success());
        REQUIRE(plan.slave_interface == "wlan0");
        REQUIRE(plan.slave_auto_selected);
    }

    SECTION("activated Ethernet wins over activated Wi-Fi") {
        add_device("wlan0", device_type::WIFI, device_state::ACTIVATED);
        add_device("eth0", device_type::ETHERNET, device_state::ACTIVATED);

        BridgePlan plan;
        REQUIRE(planner.plan(o, run, plan).success());
        REQUIRE(plan.slave_interface == "eth0");
    }

    SECTION("first in interface-name order") {
        add_device("enp7s0", device_type::ETHERNET, device_state::ACTIVATED);
        add_device("enp1s0", device_type::ETHERNET, device_state::ACTIVATED);

        BridgePlan plan;
        REQUIRE(planner.plan(o, run, plan).success());
        REQUIRE(plan.slave_interface == "enp1s0");
    }

    SECTION("ignored prefixes are never selected") {
        add_device("docker0", device_type::ETHERNET, device_state::ACTIVATED);
        add_device("vnet3", device_type::ETHERNET, device_state::ACTIVATED);
        REQUIRE(plan_result(o) == BridgeResult::NO_CANDIDATE_INTERFACE);
    }

    SECTION("nothing activated") {
        add_device("eth0", device_type::ETHERNET, device_state::DISCONNECTED);
        add_device("wlan0", device_type::WIFI, device_state::UNAVAILABLE);
        add_device("br0", device_type::BRIDGE, device_state::ACTIVATED);
        REQUIRE(plan_result(o) == BridgeResult::NO_CANDIDATE_INTERFACE);
    }
}

TEST_CASE_METHOD(PlannerTestFixture, "Planner explicit slave checks", "[bridge_planner]") {
    add_device("eth0", device_type::ETHERNET, device_state::ACTIVATED, "52:54:00:12:34:56");
    add_device("eth1", device_type::ETHERNET, device_state::DISCONNECTED);

    SECTION("unknown interface") {
        REQUIRE(plan_result(options_for("eth9")) == BridgeResult::INTERFACE_NOT_FOUND);
    }

    SECTION("disconnected interface is accepted when named explicitly") {
        REQUIRE(plan_result(options_for("eth1")) == BridgeResult::SUCCESS);
    }

    SECTION("interface bridged elsewhere") {
        std::string other = add_bridge("c-lab", "lab0");
        add_port("c-lab-port-eth0", "eth0", other);

        REQUIRE(plan_result(options_for("eth0")) == BridgeResult::INTERFACE_ALREADY_BRIDGED);

        run.force = true;
        REQUIRE(plan_result(options_for("eth0")) == BridgeResult::SUCCESS);
    }

    SECTION("port of the bridge being replaced is not reported here") {
        std::string same = add_bridge("c-mybr0", "mybr0");
        add_port("c-mybr0-port-eth0", "eth0", same);
        REQUIRE(plan_result(options_for("eth0")) == BridgeResult::SUCCESS);
    }

    SECTION("unreachable service") {
        backend.set_service_available(false);
        REQUIRE(plan_result(options_for("eth0")) == BridgeResult::SERVICE_UNAVAILABLE);
    }
}

TEST_CASE_METHOD(PlannerTestFixture, "Planner fills the plan", "[bridge_planner]") {
    add_device("eth0", device_type::ETHERNET, device_state::ACTIVATED, "52:54:00:12:34:56");
    add_device("wg0", device_type::ETHERNET, device_state::ACTIVATED);

    BridgeOptions o = options_for("eth0");
    o.conn_name = "c-lab";
    o.bridge_ifname = "lab0";
    o.stp = false;
    o.stp_priority = 4096;
    o.vlan_filtering = true;
    o.vlan_default_pvid = 20;
    run.dry_run = true;

    SECTION("settings and names") {
        BridgePlan plan;
        REQUIRE(planner.plan(o, run, plan).success());
        REQUIRE(plan.conn_name == "c-lab");
        REQUIRE(plan.bridge_ifname == "lab0");
        REQUIRE(plan.port_conn_name == "c-lab-port-eth0");
        REQUIRE_FALSE(plan.slave_auto_selected);
        REQUIRE(plan.dry_run);
        REQUIRE_FALSE(plan.force);
        REQUIRE_FALSE(plan.bridge.stp);
        REQUIRE(plan.bridge.priority == 4096u);
        REQUIRE_FALSE(plan.bridge.forward_delay.has_value());
        REQUIRE(plan.bridge.vlan_filtering);
        REQUIRE(plan.bridge.vlan_default_pvid == 20u);
    }

    SECTION("MAC is cloned from the slave") {
        BridgePlan plan;
        REQUIRE(planner.plan(o, run, plan).success());
        REQUIRE(plan.bridge.mac_address == "52:54:00:12:34:56");
    }

    SECTION("no clone when disabled") {
        o.clone_mac = false;
        BridgePlan plan;
        REQUIRE(planner.plan(o, run, plan).success());
        REQUIRE(plan.bridge.mac_address.empty());
    }

    SECTION("slave without MAC skips cloning") {
        o.slave_interface = "wg0";
        BridgePlan plan;
        REQUIRE(planner.plan(o, run, plan).success());
        REQUIRE(plan.bridge.mac_address.empty());
    }
}
