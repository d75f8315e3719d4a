#pragma once

#include "ElevatedSurfaceRegistry.h"
#include <glm/glm.hpp>
#include <string>
#include <vector>

// Dimensions of the standard scaffold wrapped around a building under construction
struct ScaffoldLayout {
    float buildingWidth = 6.0f;         // X extent of the footprint
    float buildingDepth = 5.0f;         // Z extent of the footprint
    std::vector<float> levels{2.5f, 5.0f}; // Platform heights above the base
    float platformOffset = 1.0f;        // Gap between wall and platform center line
    float platformDepth = 1.2f;
    float platformCost = 1.2f;
    float stairWidth = 0.8f;
    float stairDepth = 4.0f;            // Horizontal run of the ground stair
    float stairCost = 1.5f;
    float groundClearance = 0.1f;
};

/**
 * Register front/back/left/right platforms for every level, a stair from the
 * ground onto the first front platform and a ladder between consecutive
 * front platforms. Ids follow "<building>-scaffold-f<level>-<side>".
 */
void registerScaffolding(ElevatedSurfaceRegistry& registry,
                         const std::string& buildingId,
                         const glm::vec2& buildingCenter,
                         float baseY = 0.0f,
                         const ScaffoldLayout& layout = {});

// Id of the platform on a given side ("front", "back", "left", "right") and 1-based level
std::string scaffoldSurfaceId(const std::string& buildingId, int level, const std::string& side);

// Where a newly assigned worker is placed: the middle of the first front platform
glm::vec3 scaffoldEntryPosition(const glm::vec2& buildingCenter,
                                float baseY = 0.0f,
                                const ScaffoldLayout& layout = {});
