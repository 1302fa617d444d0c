#include "AppConfig.hpp"
#include "../common/Ipv4.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>

namespace netsweep::config
{
    namespace
    {
        const std::string kTag = "Config";

        int CheckedPort(int port, const std::string &where)
        {
            if (port <= 0 || port > 65535)
                throw ConfigError(where + ": port " + std::to_string(port) + " is out of range");
            return port;
        }

        std::vector<int> ParsePortList(const YAML::Node &n, const std::string &where)
        {
            if (!n.IsSequence())
                throw ConfigError(where + " must be a list of ports");

            std::vector<int> ports;
            for (const auto &item : n)
                ports.push_back(CheckedPort(item.as<int>(), where));
            return ports;
        }

        // {port: description} in document order.
        detection::PortDescriptions ParsePortMap(const YAML::Node &n, const std::string &where)
        {
            if (!n.IsMap())
                throw ConfigError(where + " must map ports to descriptions");

            detection::PortDescriptions out;
            for (const auto &kv : n)
                out.emplace_back(CheckedPort(kv.first.as<int>(), where), kv.second.as<std::string>());
            return out;
        }

        std::vector<std::string> ParseSubnets(const YAML::Node &n)
        {
            std::vector<std::string> prefixes;
            if (n.IsScalar())
            {
                std::string value = n.as<std::string>();
                if (value == "auto" || value.empty())
                    return prefixes;
                prefixes.push_back(value);
            }
            else if (n.IsSequence())
            {
                for (const auto &item : n)
                    prefixes.push_back(item.as<std::string>());
            }
            else
            {
                throw ConfigError("scanner.subnet_base must be \"auto\", a prefix or a list of prefixes");
            }

            for (const auto &p : prefixes)
            {
                if (!common::IsValidSubnetPrefix(p))
                    throw ConfigError("scanner.subnet_base: '" + p + "' is not a three-octet prefix like 192.168.1");
            }
            return prefixes;
        }

        void ParseScanner(const YAML::Node &s, AppConfig &cfg)
        {
            auto &o = cfg.scanner;

            if (s["scan_interval_minutes"])
                o.scan_interval = std::chrono::minutes(s["scan_interval_minutes"].as<int>(5));
            if (s["max_concurrent_connections"])
                o.max_concurrent_connections = s["max_concurrent_connections"].as<int>(o.max_concurrent_connections);
            if (s["ping_timeout_ms"])
                o.ping_timeout = std::chrono::milliseconds(s["ping_timeout_ms"].as<int>(2000));
            if (s["start_ip"])
                o.start_octet = s["start_ip"].as<int>(o.start_octet);
            if (s["end_ip"])
                o.end_octet = s["end_ip"].as<int>(o.end_octet);
            if (s["network_throttle_delay_ms"])
                o.network_throttle_delay = std::chrono::milliseconds(s["network_throttle_delay_ms"].as<int>(50));
            if (s["devices_before_throttle"])
                o.devices_before_throttle = s["devices_before_throttle"].as<int>(o.devices_before_throttle);
            if (s["enable_continuous_scanning"])
                o.enable_continuous_scanning = s["enable_continuous_scanning"].as<bool>(o.enable_continuous_scanning);
            if (s["probe_settle_delay_ms"])
                o.probe_settle_delay = std::chrono::milliseconds(std::max(0, s["probe_settle_delay_ms"].as<int>(25)));

            if (s["subnet_base"])
                cfg.subnets = ParseSubnets(s["subnet_base"]);

            for (const auto &fix : core::NormalizeScanOptions(o))
                common::LogWarn(kTag, fix);
        }

        void ParsePorts(const YAML::Node &p, detection::PortDetectionOptions &o)
        {
            if (p["custom_iot_ports"])
                o.custom_iot_ports = ParsePortList(p["custom_iot_ports"], "ports.custom_iot_ports");
            if (p["standard_http_ports"])
                o.standard_http_ports = ParsePortList(p["standard_http_ports"], "ports.standard_http_ports");
            if (p["tls_ports"])
                o.tls_ports = ParsePortList(p["tls_ports"], "ports.tls_ports");
            if (p["service_endpoints"])
                o.service_endpoints = ParsePortMap(p["service_endpoints"], "ports.service_endpoints");
            if (p["windows_service_ports"])
                o.windows_service_ports = ParsePortMap(p["windows_service_ports"], "ports.windows_service_ports");
            if (p["ssh_port"])
                o.ssh_port = CheckedPort(p["ssh_port"].as<int>(o.ssh_port), "ports.ssh_port");
            if (p["port_connection_timeout_ms"])
                o.port_connection_timeout = std::chrono::milliseconds(std::max(1, p["port_connection_timeout_ms"].as<int>(1000)));
        }

        void ParseDetectors(const YAML::Node &d, detection::DetectorToggles &t)
        {
            if (d["upnp"])
                t.upnp = d["upnp"].as<bool>(t.upnp);
            if (d["service_endpoints"])
                t.service_endpoints = d["service_endpoints"].as<bool>(t.service_endpoints);
            if (d["http"])
                t.http = d["http"].as<bool>(t.http);
            if (d["ssh"])
                t.ssh = d["ssh"].as<bool>(t.ssh);
            if (d["windows_services"])
                t.windows_services = d["windows_services"].as<bool>(t.windows_services);
        }

        AppConfig FromNode(const YAML::Node &y)
        {
            AppConfig cfg;
            if (!y || y.IsNull())
                return cfg;
            if (!y.IsMap())
                throw ConfigError("top level of the configuration must be a mapping");

            if (y["log_level"])
            {
                std::string level = y["log_level"].as<std::string>();
                if (!common::ParseLogLevel(level, cfg.log_level))
                    throw ConfigError("log_level: unknown level '" + level + "'");
            }

            if (auto s = y["scanner"])
                ParseScanner(s, cfg);
            if (auto p = y["ports"])
                ParsePorts(p, cfg.ports);
            if (auto d = y["detectors"])
                ParseDetectors(d, cfg.detectors);
            if (auto st = y["storage"])
            {
                if (st["database"])
                    cfg.storage.database = st["database"].as<std::string>(cfg.storage.database);
            }

            return cfg;
        }
    }

    AppConfig LoadAppConfig(const std::string &path)
    {
        try
        {
            return FromNode(YAML::LoadFile(path));
        }
        catch (const YAML::BadFile &)
        {
            throw ConfigError("cannot read configuration file '" + path + "'");
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError(path + ": " + e.what());
        }
    }

    AppConfig LoadAppConfigFromString(const std::string &yaml)
    {
        try
        {
            return FromNode(YAML::Load(yaml));
        }
        catch (const YAML::Exception &e)
        {
            throw ConfigError(e.what());
        }
    }
}
