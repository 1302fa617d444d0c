#include <catch2/catch.hpp>
#include "../detection/DetectorFactory.hpp"
#include "../detection/HttpDetector.hpp"
#include "../detection/SshDetector.hpp"
#include "../detection/UpnpDetector.hpp"
#include "../detection/WindowsServicesDetector.hpp"
#include "../common/Log.hpp"

using namespace netsweep;
using namespace netsweep::detection;

TEST_CASE("SSH banners map to distributions", "[detectors][ssh]")
{
    CHECK(ParseSshBanner("SSH-2.0-OpenSSH_9.6p1 Ubuntu-3ubuntu13") == std::optional<std::string>("Ubuntu Linux (SSH)"));
    CHECK(ParseSshBanner("SSH-2.0-OpenSSH_9.2p1 Debian-2+deb12u2") == std::optional<std::string>("Debian Linux (SSH)"));
    CHECK(ParseSshBanner("SSH-2.0-OpenSSH_7.4p1 Raspbian-10") == std::optional<std::string>("Raspberry Pi (SSH)"));
    CHECK(ParseSshBanner("SSH-2.0-OpenSSH_8.0") == std::optional<std::string>("Linux/Unix (SSH)"));
    CHECK(ParseSshBanner("SSH-2.0-dropbear_2022.83") == std::optional<std::string>("Unknown (SSH)"));
    CHECK_FALSE(ParseSshBanner("220 ftp ready"));
}

TEST_CASE("HTTP Server headers map to platforms", "[detectors][http]")
{
    auto head = [](const std::string &server)
    { return "HTTP/1.1 200 OK\r\nServer: " + server + "\r\nContent-Length: 0\r\n\r\n"; };

    CHECK(ParseHttpServerHeader(head("Microsoft-IIS/10.0"), 80) == std::optional<std::string>("Windows Server 2016/2019/2022 (HTTP)"));
    CHECK(ParseHttpServerHeader(head("Microsoft-IIS/8.5"), 80) == std::optional<std::string>("Windows Server 2012 R2 (HTTP)"));
    CHECK(ParseHttpServerHeader(head("Microsoft-IIS/8.0"), 80) == std::optional<std::string>("Windows Server 2012 (HTTP)"));
    CHECK(ParseHttpServerHeader(head("Microsoft-IIS/7.5"), 80) == std::optional<std::string>("Windows Server (HTTP)"));
    CHECK(ParseHttpServerHeader(head("Kestrel"), 5000) == std::optional<std::string>("Windows/Linux (.NET) (HTTP)"));
    CHECK(ParseHttpServerHeader(head("nginx/1.24.0"), 80) == std::optional<std::string>("Linux Server (HTTP)"));
    CHECK(ParseHttpServerHeader(head("Apache/2.4.58 (Debian)"), 80) == std::optional<std::string>("Linux Server (HTTP)"));
    CHECK(ParseHttpServerHeader(head("Microsoft-HTTPAPI/2.0"), 80) == std::optional<std::string>("Windows Server (HTTP)"));
    CHECK(ParseHttpServerHeader("HTTP/1.1 200 OK\r\nX-Powered-By: ASP.NET\r\n\r\n", 80) ==
          std::optional<std::string>("Windows Server (.NET) (HTTP)"));
}

TEST_CASE("Unrecognised HTTP servers fall back to the port", "[detectors][http]")
{
    const std::string plain = "HTTP/1.0 404 Not Found\r\nServer: tiny\r\n\r\n";
    CHECK(ParseHttpServerHeader(plain, 5000) == std::optional<std::string>("Unknown (.NET App) (HTTP)"));
    CHECK(ParseHttpServerHeader(plain, 8080) == std::optional<std::string>("Unknown (Web App) (HTTP)"));
    CHECK(ParseHttpServerHeader(plain, 8443) == std::optional<std::string>("Unknown (Secure Web) (HTTP)"));
    CHECK(ParseHttpServerHeader(plain, 443) == std::optional<std::string>("Unknown (HTTP)"));
    CHECK_FALSE(ParseHttpServerHeader("SSH-2.0-OpenSSH", 8080));
}

TEST_CASE("Windows service ports separate servers from clients", "[detectors][windows]")
{
    CHECK(DescribeWindowsService(3389, "Remote Desktop Protocol") == "Windows Server (Remote Desktop Protocol)");
    CHECK(DescribeWindowsService(5986, "WinRM HTTPS") == "Windows Server (WinRM HTTPS)");
    CHECK(DescribeWindowsService(445, "SMB") == "Windows Client (SMB)");
    CHECK(DescribeWindowsService(135, "RPC") == "Windows Client (RPC)");
}

TEST_CASE("SSDP answers are parsed", "[detectors][upnp]")
{
    const std::string answer =
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=1800\r\n"
        "Location: http://192.168.1.50:49152/description.xml\r\n"
        "SERVER: Linux/5.10 UPnP/1.0 MiniUPnPd/2.3\r\n"
        "ST: upnp:rootdevice\r\n"
        "\r\n";

    auto parsed = ParseSsdpResponse(answer, "192.168.1.50");
    REQUIRE(parsed);
    CHECK(parsed->origin == "192.168.1.50");
    CHECK(parsed->location == "http://192.168.1.50:49152/description.xml");
    CHECK(parsed->server == "Linux/5.10 UPnP/1.0 MiniUPnPd/2.3");
    CHECK(parsed->search_target == "upnp:rootdevice");

    CHECK_FALSE(ParseSsdpResponse("NOTIFY * HTTP/1.1\r\nLOCATION: http://x/\r\n\r\n", "1.2.3.4"));
    CHECK_FALSE(ParseSsdpResponse("HTTP/1.1 200 OK\r\nST: x\r\n\r\n", "1.2.3.4"));
}

TEST_CASE("Description URLs are split", "[detectors][upnp]")
{
    auto url = ParseHttpUrl("http://192.168.1.50:49152/rootDesc.xml");
    REQUIRE(url);
    CHECK(url->host == "192.168.1.50");
    CHECK(url->port == 49152);
    CHECK(url->path == "/rootDesc.xml");

    auto bare = ParseHttpUrl("HTTP://10.0.0.2");
    REQUIRE(bare);
    CHECK(bare->port == 80);
    CHECK(bare->path == "/");

    CHECK_FALSE(ParseHttpUrl("https://10.0.0.2/"));
    CHECK_FALSE(ParseHttpUrl("http://10.0.0.2:99999/"));
    CHECK_FALSE(ParseHttpUrl("http://:80/"));
}

TEST_CASE("UPnP device descriptions are read from the root device", "[detectors][upnp]")
{
    const std::string xml =
        "<?xml version=\"1.0\"?>\n"
        "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
        "  <specVersion><major>1</major><minor>0</minor></specVersion>\n"
        "  <device>\n"
        "    <deviceType>urn:schemas-upnp-org:device:MediaServer:1</deviceType>\n"
        "    <friendlyName>Living Room NAS</friendlyName>\n"
        "    <manufacturer>Synology &amp; Co</manufacturer>\n"
        "    <modelName>DS920+</modelName>\n"
        "    <deviceList>\n"
        "      <device><friendlyName>Embedded</friendlyName></device>\n"
        "    </deviceList>\n"
        "  </device>\n"
        "</root>\n";

    auto description = ParseUpnpDescription(xml);
    REQUIRE(description);
    CHECK(description->friendly_name == "Living Room NAS");
    CHECK(description->manufacturer == "Synology & Co");
    CHECK(description->model_name == "DS920+");
    CHECK(description->device_type == "urn:schemas-upnp-org:device:MediaServer:1");

    CHECK(BuildUpnpDescription(*description) == "Living Room NAS - Media Server (UPnP)");
    CHECK_FALSE(ParseUpnpDescription("<root><specVersion/></root>"));
}

TEST_CASE("UPnP descriptions fall back through the available fields", "[detectors][upnp]")
{
    UpnpDescription d;
    CHECK(BuildUpnpDescription(d) == "UPnP Device");

    d.manufacturer = "Philips";
    CHECK(BuildUpnpDescription(d) == "Philips (UPnP)");

    d.model_name = "Hue Bridge";
    CHECK(BuildUpnpDescription(d) == "Philips Hue Bridge (UPnP)");

    d.friendly_name = "Philips";
    d.device_type = "urn:schemas-upnp-org:device:Basic:1";
    CHECK(BuildUpnpDescription(d) == "Philips Hue Bridge (UPnP)");

    d.device_type = "urn:schemas-upnp-org:device:InternetGatewayDevice:1";
    CHECK(BuildUpnpDescription(d) == "Philips Hue Bridge - Router/Gateway (UPnP)");
}

TEST_CASE("UPnP type hints", "[detectors][upnp]")
{
    CHECK(ExtractUpnpTypeHint("urn:schemas-upnp-org:device:MediaRenderer:1") == std::optional<std::string>("Media Renderer"));
    CHECK(ExtractUpnpTypeHint("urn:schemas-upnp-org:device:Printer:1") == std::optional<std::string>("Printer"));
    CHECK(ExtractUpnpTypeHint("urn:schemas-upnp-org:device:WANDevice:1") == std::nullopt);
    CHECK(ExtractUpnpTypeHint("urn:dial-multiscreen-org:device:tvreceiver:1") == std::optional<std::string>("Smart TV"));
    CHECK_FALSE(ExtractUpnpTypeHint(""));
}

TEST_CASE("Detector sets follow the toggles", "[detectors]")
{
    common::SetLogLevel(common::LogLevel::Error);
    PortDetectionOptions options;

    auto defaults = CreateDefaultDetectors(options);
    CHECK(defaults.size() == 4);

    auto enhanced = CreateEnhancedDetectors(options);
    CHECK(enhanced.size() == 5);

    DetectorToggles toggles;
    toggles.http = false;
    toggles.upnp = false;
    auto chain = CreateDetectionChain(options, toggles);
    REQUIRE(chain->Detectors().size() == 3);
    CHECK(chain->Detectors()[0]->Name() == "ServiceEndpoint");
    CHECK(chain->Detectors()[1]->Name() == "SSH");
    CHECK(chain->Detectors()[2]->Name() == "WindowsServices");
}
