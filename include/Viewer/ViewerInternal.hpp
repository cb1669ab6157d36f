#pragma once
#include "core/Common.hpp"

#if __has_include(<glad/glad.h>)
  #include <glad/glad.h>
#else
  #error "glad/glad.h not found. Install glad or point GLAD_INCLUDE_DIR at it."
#endif

#include <GLFW/glfw3.h>

struct Vertex
{
    float x, y;
    float r, g, b, a;
};

struct Color
{
    float r, g, b;
};

// 向顶点数组添加一个矩形 (NDC)
inline void PushRect(std::vector<Vertex>& out,
                     float x0, float y0, float x1, float y1,
                     const Color& c,
                     float a = 1.0f)
{
    out.push_back({x0, y0, c.r, c.g, c.b, a});
    out.push_back({x1, y0, c.r, c.g, c.b, a});
    out.push_back({x1, y1, c.r, c.g, c.b, a});

    out.push_back({x0, y0, c.r, c.g, c.b, a});
    out.push_back({x1, y1, c.r, c.g, c.b, a});
    out.push_back({x0, y1, c.r, c.g, c.b, a});
}
