#include "graphlens/render/GlRenderer.h"
#include "graphlens/common/Logger.h"
#include "GlResources.h"

namespace graphlens {

namespace {

// Node point sprites; a_size is in world units and scaled by zoom
constexpr const char* NODE_VS = R"(#version 300 es
precision highp float;
uniform mat3 u_view;
uniform float u_zoom;
in vec2 a_position;
in float a_size;
in vec4 a_color;
out vec4 v_color;
void main() {
    vec3 pos = u_view * vec3(a_position, 1.0);
    gl_Position = vec4(pos.xy, 0.0, 1.0);
    gl_PointSize = a_size * u_zoom;
    v_color = a_color;
}
)";

constexpr const char* NODE_FS = R"(#version 300 es
precision highp float;
in vec4 v_color;
out vec4 fragColor;
void main() {
    vec2 p = gl_PointCoord * 2.0 - 1.0;
    float dist = dot(p, p);
    if (dist > 1.0) discard;
    float alpha = 1.0 - smoothstep(0.8, 1.0, dist);
    fragColor = vec4(v_color.rgb, v_color.a * alpha);
}
)";

constexpr const char* EDGE_VS = R"(#version 300 es
precision highp float;
uniform mat3 u_view;
in vec2 a_position;
in vec4 a_color;
out vec4 v_color;
void main() {
    vec3 pos = u_view * vec3(a_position, 1.0);
    gl_Position = vec4(pos.xy, 0.0, 1.0);
    v_color = a_color;
}
)";

// Instanced arrow heads: one template triangle per visible edge
constexpr const char* ARROW_VS = R"(#version 300 es
precision highp float;
uniform mat3 u_view;
uniform float u_arrowSize;
uniform float u_zoom;
in vec2 a_template;
in vec2 a_target;
in vec2 a_direction;
in vec4 a_color;
in float a_targetSize;
out vec4 v_color;
void main() {
    vec2 dir = normalize(a_direction);
    vec2 perp = vec2(-dir.y, dir.x);

    float nodeRadiusWorld = a_targetSize * 0.5 / u_zoom;
    float arrowLenWorld = u_arrowSize * 3.0 / u_zoom;

    vec2 arrowTip = a_target - dir * nodeRadiusWorld;
    vec2 worldPos = arrowTip
        + dir * (a_template.x * arrowLenWorld)
        + perp * (a_template.y * arrowLenWorld * 0.4);

    vec3 pos = u_view * vec3(worldPos, 1.0);
    gl_Position = vec4(pos.xy, 0.0, 1.0);
    v_color = a_color;
}
)";

constexpr const char* FLAT_FS = R"(#version 300 es
precision highp float;
in vec4 v_color;
out vec4 fragColor;
void main() {
    fragColor = v_color;
}
)";

// Tip at the origin, base corners behind it
constexpr float ARROW_TEMPLATE[] = {0.0f, 0.0f, -1.0f, -1.0f, -1.0f, 1.0f};

GLuint attribLocation(const gl::Program& program, const char* name) {
    GLint location = glGetAttribLocation(program.id(), name);
    if (location < 0) {
        throw RenderContextError(std::string("Missing shader attribute: ") + name);
    }
    return static_cast<GLuint>(location);
}

void bindAttribute(const gl::Program& program, const char* name, const gl::Buffer& buffer,
                   GLint components, GLuint divisor = 0) {
    const GLuint location = attribLocation(program, name);
    glBindBuffer(GL_ARRAY_BUFFER, buffer.id());
    glEnableVertexAttribArray(location);
    glVertexAttribPointer(location, components, GL_FLOAT, GL_FALSE, 0, nullptr);
    if (divisor != 0) {
        glVertexAttribDivisor(location, divisor);
    }
}

void upload(const gl::Buffer& buffer, const std::vector<float>& data, GLenum usage) {
    glBindBuffer(GL_ARRAY_BUFFER, buffer.id());
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(data.size() * sizeof(float)),
                 data.empty() ? nullptr : data.data(), usage);
}

}  // namespace

struct GlRenderer::Resources {
    gl::Program nodeProgram;
    gl::VertexArray nodeVao;
    gl::Buffer nodePositions;
    gl::Buffer nodeSizes;
    gl::Buffer nodeColors;

    gl::Program edgeProgram;
    gl::VertexArray edgeVao;
    gl::Buffer edgePositions;
    gl::Buffer edgeColors;

    gl::Program arrowProgram;
    gl::VertexArray arrowVao;
    gl::Buffer arrowTemplate;
    gl::Buffer arrowTargets;
    gl::Buffer arrowDirections;
    gl::Buffer arrowColors;
    gl::Buffer arrowTargetSizes;

    GLint nodeViewLoc = -1;
    GLint nodeZoomLoc = -1;
    GLint edgeViewLoc = -1;
    GLint arrowViewLoc = -1;
    GLint arrowSizeLoc = -1;
    GLint arrowZoomLoc = -1;
};

GlRenderer::GlRenderer() {
    if (glGetString(GL_VERSION) == nullptr) {
        throw RenderContextError("No current OpenGL ES context");
    }

    auto res = std::make_unique<Resources>();

    // Nodes
    res->nodeProgram = gl::linkProgram(NODE_VS, NODE_FS);
    res->nodeVao = gl::createVertexArray();
    res->nodePositions = gl::createBuffer();
    res->nodeSizes = gl::createBuffer();
    res->nodeColors = gl::createBuffer();

    glBindVertexArray(res->nodeVao.id());
    bindAttribute(res->nodeProgram, "a_position", res->nodePositions, 2);
    bindAttribute(res->nodeProgram, "a_size", res->nodeSizes, 1);
    bindAttribute(res->nodeProgram, "a_color", res->nodeColors, 4);
    glBindVertexArray(0);

    // Edges
    res->edgeProgram = gl::linkProgram(EDGE_VS, FLAT_FS);
    res->edgeVao = gl::createVertexArray();
    res->edgePositions = gl::createBuffer();
    res->edgeColors = gl::createBuffer();

    glBindVertexArray(res->edgeVao.id());
    bindAttribute(res->edgeProgram, "a_position", res->edgePositions, 2);
    bindAttribute(res->edgeProgram, "a_color", res->edgeColors, 4);
    glBindVertexArray(0);

    // Arrows
    res->arrowProgram = gl::linkProgram(ARROW_VS, FLAT_FS);
    res->arrowVao = gl::createVertexArray();
    res->arrowTemplate = gl::createBuffer();
    res->arrowTargets = gl::createBuffer();
    res->arrowDirections = gl::createBuffer();
    res->arrowColors = gl::createBuffer();
    res->arrowTargetSizes = gl::createBuffer();

    glBindVertexArray(res->arrowVao.id());
    glBindBuffer(GL_ARRAY_BUFFER, res->arrowTemplate.id());
    glBufferData(GL_ARRAY_BUFFER, sizeof(ARROW_TEMPLATE), ARROW_TEMPLATE, GL_STATIC_DRAW);
    bindAttribute(res->arrowProgram, "a_template", res->arrowTemplate, 2);
    bindAttribute(res->arrowProgram, "a_target", res->arrowTargets, 2, 1);
    bindAttribute(res->arrowProgram, "a_direction", res->arrowDirections, 2, 1);
    bindAttribute(res->arrowProgram, "a_color", res->arrowColors, 4, 1);
    bindAttribute(res->arrowProgram, "a_targetSize", res->arrowTargetSizes, 1, 1);
    glBindVertexArray(0);

    res->nodeViewLoc = glGetUniformLocation(res->nodeProgram.id(), "u_view");
    res->nodeZoomLoc = glGetUniformLocation(res->nodeProgram.id(), "u_zoom");
    res->edgeViewLoc = glGetUniformLocation(res->edgeProgram.id(), "u_view");
    res->arrowViewLoc = glGetUniformLocation(res->arrowProgram.id(), "u_view");
    res->arrowSizeLoc = glGetUniformLocation(res->arrowProgram.id(), "u_arrowSize");
    res->arrowZoomLoc = glGetUniformLocation(res->arrowProgram.id(), "u_zoom");

    res_ = std::move(res);
    LOG_INFO("GL renderer ready ({})", reinterpret_cast<const char*>(glGetString(GL_VERSION)));
}

GlRenderer::~GlRenderer() = default;

void GlRenderer::setNodePositions(const std::vector<float>& positions) {
    nodeCount_ = positions.size() / 2;
    upload(res_->nodePositions, positions, GL_STATIC_DRAW);
}

void GlRenderer::setEdgePositions(const std::vector<float>& positions) {
    edgeCount_ = positions.size() / 4;
    upload(res_->edgePositions, positions, GL_STATIC_DRAW);
}

void GlRenderer::setNodeColors(const std::vector<float>& colors) {
    upload(res_->nodeColors, colors, GL_DYNAMIC_DRAW);
}

void GlRenderer::setNodeSizes(const std::vector<float>& sizes) {
    upload(res_->nodeSizes, sizes, GL_DYNAMIC_DRAW);
}

void GlRenderer::setEdgeColors(const std::vector<float>& colors) {
    upload(res_->edgeColors, colors, GL_DYNAMIC_DRAW);
}

void GlRenderer::setArrows(const ArrowInstances& arrows) {
    arrowCount_ = arrows.count();
    upload(res_->arrowTargets, arrows.targets, GL_DYNAMIC_DRAW);
    upload(res_->arrowDirections, arrows.directions, GL_DYNAMIC_DRAW);
    upload(res_->arrowColors, arrows.colors, GL_DYNAMIC_DRAW);
    upload(res_->arrowTargetSizes, arrows.targetSizes, GL_DYNAMIC_DRAW);
}

void GlRenderer::setViewport(int width, int height) {
    glViewport(0, 0, width, height);
}

void GlRenderer::render(const std::array<float, 9>& viewMatrix,
                        const Color& background,
                        float arrowSizeScale,
                        float zoomPixels) {
    glClearColor(background.r, background.g, background.b, background.a);
    glClear(GL_COLOR_BUFFER_BIT);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    if (edgeCount_ > 0) {
        glUseProgram(res_->edgeProgram.id());
        glUniformMatrix3fv(res_->edgeViewLoc, 1, GL_FALSE, viewMatrix.data());
        glBindVertexArray(res_->edgeVao.id());
        glDrawArrays(GL_LINES, 0, static_cast<GLsizei>(edgeCount_ * 2));
    }

    if (arrowCount_ > 0) {
        glUseProgram(res_->arrowProgram.id());
        glUniformMatrix3fv(res_->arrowViewLoc, 1, GL_FALSE, viewMatrix.data());
        glUniform1f(res_->arrowSizeLoc, arrowSizeScale);
        glUniform1f(res_->arrowZoomLoc, zoomPixels);
        glBindVertexArray(res_->arrowVao.id());
        glDrawArraysInstanced(GL_TRIANGLES, 0, 3, static_cast<GLsizei>(arrowCount_));
    }

    // Nodes last so they sit on top of edges and arrows
    if (nodeCount_ > 0) {
        glUseProgram(res_->nodeProgram.id());
        glUniformMatrix3fv(res_->nodeViewLoc, 1, GL_FALSE, viewMatrix.data());
        glUniform1f(res_->nodeZoomLoc, zoomPixels);
        glBindVertexArray(res_->nodeVao.id());
        glDrawArrays(GL_POINTS, 0, static_cast<GLsizei>(nodeCount_));
    }

    glBindVertexArray(0);
}

}  // namespace graphlens
