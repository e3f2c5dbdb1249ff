module;
#include <cmath>
#include <mutex>
#include <string>

#include <glm/glm.hpp>

module Graphics:Model.Impl;
import :Model;
import Core.Error;
import Core.Logging;

namespace Graphics
{
    glm::mat3 ComputeNormalMatrix(const glm::mat4& transform, bool* singular)
    {
        const glm::mat3 upper(transform);
        const float det = glm::determinant(upper);
        const bool degenerate = !std::isfinite(det) || std::abs(det) <= 1e-12f;
        if (singular) *singular = degenerate;
        if (degenerate) return glm::mat3(1.0f);
        return glm::transpose(glm::inverse(upper));
    }

    InstanceId Model::NewInstance()
    {
        Instances.emplace_back();
        return static_cast<InstanceId>(Instances.size() - 1);
    }

    Core::Result Model::UpdateInstance(InstanceId id, const glm::mat4& transform)
    {
        if (id >= Instances.size())
        {
            Core::Log::Error("Model '{}': instance {} out of range ({} instances)", Name, id, Instances.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        bool singular = false;
        InstanceRecord& record = Instances[id];
        record.Model = transform;
        record.Normal = ComputeNormalMatrix(transform, &singular);
        if (singular)
        {
            Core::Log::Error("Model '{}': instance {} has a singular transform, using identity normal matrix",
                             Name, id);
        }
        return Core::Ok();
    }
}
