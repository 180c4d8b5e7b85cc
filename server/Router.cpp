#include "Router.hpp"
#include "../common/Codec.hpp"
#include "../common/Log.hpp"

namespace net_watch::server
{
    namespace
    {
        const std::string DEVICES_PATH = "/api/devices";
        const std::string DEVICE_PREFIX = "/api/devices/";
        const std::string STATUS_PATH = "/api/status";
        const std::string EXPORT_PATH = "/devices.json";

        protocol::Response Json(int status, const nlohmann::json &body)
        {
            protocol::Response response;
            response.status = status;
            response.body = body.dump();
            return response;
        }

        protocol::Response Error(int status, const std::string &message)
        {
            return Json(status, {{"error", message}});
        }

        std::string StringField(const nlohmann::json &body, const char *key)
        {
            auto it = body.find(key);
            if (it == body.end() || !it->is_string())
                return "";
            return it->get<std::string>();
        }
    }

    Router::Router(Registry &registry, probe::ProbeCoordinator &coordinator)
        : m_registry(registry), m_coordinator(coordinator)
    {
    }

    protocol::Response Router::Handle(const protocol::Request &request)
    {
        using protocol::Method;

        try
        {
            if (request.path == DEVICES_PATH)
            {
                if (request.method == Method::Get)
                    return ListDevices();
                if (request.method == Method::Post)
                    return CreateDevice(request);
                return Error(405, "method not allowed");
            }

            if (request.path.compare(0, DEVICE_PREFIX.size(), DEVICE_PREFIX) == 0)
            {
                std::string id = request.path.substr(DEVICE_PREFIX.size());
                if (id.empty() || id.find('/') != std::string::npos)
                    return Error(404, "not found");
                if (request.method == Method::Delete)
                    return DeleteDevice(id);
                return Error(405, "method not allowed");
            }

            if (request.path == STATUS_PATH)
            {
                if (request.method == Method::Get)
                    return Status();
                return Error(405, "method not allowed");
            }

            if (request.path == EXPORT_PATH)
            {
                if (request.method == Method::Get)
                    return ExportDevices();
                return Error(405, "method not allowed");
            }
        }
        catch (const StorageError &e)
        {
            common::LogError("Router", std::string("Storage failure: ") + e.what());
            return Error(500, "storage failure");
        }

        return Error(404, "not found");
    }

    protocol::Response Router::ListDevices()
    {
        return Json(200, m_registry.Load());
    }

    protocol::Response Router::CreateDevice(const protocol::Request &request)
    {
        nlohmann::json body = nlohmann::json::parse(request.body, nullptr, false);
        if (body.is_discarded() || !body.is_object())
        {
            return Error(400, "request body must be a JSON object");
        }

        try
        {
            common::Device device = m_registry.Add(StringField(body, "name"), StringField(body, "ip"));
            return Json(201, device);
        }
        catch (const ValidationError &e)
        {
            common::LogInfo("Router", std::string("Rejected device: ") + e.what());
            return Error(400, e.what());
        }
        catch (const DuplicateError &e)
        {
            common::LogInfo("Router", std::string("Rejected device: ") + e.what());
            return Error(409, e.what());
        }
    }

    protocol::Response Router::DeleteDevice(const std::string &id)
    {
        if (!m_registry.Remove(id))
            return Error(404, "not found");
        return Json(200, {{"ok", true}});
    }

    protocol::Response Router::Status()
    {
        common::DeviceList snapshot = m_registry.Snapshot();
        common::ProbeReport report = m_coordinator.Run(snapshot);
        return Json(200, report);
    }

    protocol::Response Router::ExportDevices()
    {
        protocol::Response response;
        response.body = nlohmann::json(m_registry.Load()).dump(2);
        return response;
    }
}
