module;
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

export module Graphics:Model;

import RHI;
import Core.Error;

export namespace Graphics
{
    // Per-instance vertex data, tightly packed (vertex-rate Instance, locations 5..11).
    struct InstanceRecord
    {
        glm::mat4 Model{1.0f};
        glm::mat3 Normal{1.0f};
    };

    using InstanceId = uint32_t;

    // A model shared by many scene nodes. Each node owns one instance slot.
    // Mesh and material resources live elsewhere; this carries the per-instance stream.
    //
    // Thread-safety: Instances and InstanceBuffer are guarded by Mutex.
    // NewInstance() and UpdateInstance() expect the caller to hold it.
    struct Model
    {
        explicit Model(std::string name) : Name(std::move(name)) {}

        Model(const Model&) = delete;
        Model& operator=(const Model&) = delete;

        std::string Name;
        std::vector<InstanceRecord> Instances;
        std::unique_ptr<RHI::Buffer> InstanceBuffer;
        std::mutex Mutex;

        // Appends an identity instance.
        [[nodiscard]] InstanceId NewInstance();

        // Writes the model matrix and its normal matrix (inverse-transpose of the upper 3x3).
        [[nodiscard]] Core::Result UpdateInstance(InstanceId id, const glm::mat4& transform);

        [[nodiscard]] size_t GetInstanceCount() const { return Instances.size(); }
        [[nodiscard]] size_t GetRequiredBufferSize() const { return Instances.size() * sizeof(InstanceRecord); }
    };

    [[nodiscard]] glm::mat3 ComputeNormalMatrix(const glm::mat4& transform, bool* singular = nullptr);
}

namespace Graphics
{
    static_assert(sizeof(InstanceRecord) == 100, "InstanceRecord must match the instance vertex layout");
}
