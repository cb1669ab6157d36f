#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <iostream>
#include <algorithm>

static GLuint CompileShader_(GLenum type, const char* src)
{
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    int success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success)
    {
        char infolog[1024];
        glGetShaderInfoLog(shader, 1024, nullptr, infolog);
        std::cerr << "Shader compilation failed: " << infolog << "\n";
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

static GLuint LinkProgram_(GLuint vs, GLuint fs)
{
    GLuint prog = glCreateProgram();
    glAttachShader(prog, vs);
    glAttachShader(prog, fs);
    glLinkProgram(prog);

    int success = 0;
    glGetProgramiv(prog, GL_LINK_STATUS, &success);
    if (!success)
    {
        char infolog[1024];
        glGetProgramInfoLog(prog, 1024, nullptr, infolog);
        std::cerr << "Program linking failed: " << infolog << "\n";
        glDeleteProgram(prog);
        return 0;
    }
    return prog;
}

static void FramebufferSizeCallback_(GLFWwindow* w, int width, int height)
{
    // no gl* here: this can fire before gladLoadGLLoader()
    if (auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w)))
        self->onFramebufferResized(std::max(1, width), std::max(1, height));
}

static void KeyCallback_(GLFWwindow* w, int key, int /*scancode*/, int action, int /*mods*/)
{
    if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS)
        glfwSetWindowShouldClose(w, GLFW_TRUE);
}

void Viewer::initWindowAndGL()
{
    if (!glfwInit())
        throw std::runtime_error("glfwInit failed");

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

    GLFWwindow* win = glfwCreateWindow(winW, winH, "Maze", nullptr, nullptr);
    if (!win)
    {
        glfwTerminate();
        throw std::runtime_error("glfwCreateWindow failed");
    }

    window = win;
    glfwMakeContextCurrent(win);
    glfwSwapInterval(1);

    glfwSetWindowUserPointer(win, this);
    glfwSetFramebufferSizeCallback(win, FramebufferSizeCallback_);
    glfwSetKeyCallback(win, KeyCallback_);

    int initW = 1, initH = 1;
    glfwGetFramebufferSize(win, &initW, &initH);
    onFramebufferResized(std::max(1, initW), std::max(1, initH));

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
    {
        glfwDestroyWindow(win);
        window = nullptr;
        glfwTerminate();
        throw std::runtime_error("gladLoadGLLoader failed");
    }

    glViewport(0, 0, fbW, fbH);

    const char* vsSrc = R"GLSL(
        #version 330 core
        layout(location = 0) in vec2 aPos;
        layout(location = 1) in vec4 aColor;
        out vec4 vColor;
        void main() {
            vColor = aColor;
            gl_Position = vec4(aPos, 0.0, 1.0);
        }
    )GLSL";

    const char* fsSrc = R"GLSL(
        #version 330 core
        in vec4 vColor;
        out vec4 FragColor;
        void main() {
            FragColor = vColor;
        }
    )GLSL";

    GLuint vs = CompileShader_(GL_VERTEX_SHADER, vsSrc);
    GLuint fs = CompileShader_(GL_FRAGMENT_SHADER, fsSrc);
    if (!vs || !fs)
    {
        if (vs) glDeleteShader(vs);
        if (fs) glDeleteShader(fs);
        throw std::runtime_error("Shader compile failed");
    }

    program = LinkProgram_(vs, fs);
    glDeleteShader(vs);
    glDeleteShader(fs);
    if (!program)
        throw std::runtime_error("Program link failed");

    glGenVertexArrays(1, &vao);
    glBindVertexArray(vao);

    glGenBuffers(1, &vbo);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);

    // location 0: vec2 aPos
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(
        0, 2, GL_FLOAT, GL_FALSE,
        sizeof(Vertex),
        (void*)offsetof(Vertex, x));

    // location 1: vec4 aColor
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(
        1, 4, GL_FLOAT, GL_FALSE,
        sizeof(Vertex),
        (void*)offsetof(Vertex, r));

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
}

void Viewer::shutdownGL()
{
    if (!window) return;

    if (program) { glDeleteProgram(program); program = 0; }
    if (vbo) { glDeleteBuffers(1, &vbo); vbo = 0; }
    if (vao) { glDeleteVertexArrays(1, &vao); vao = 0; }

    glfwDestroyWindow(static_cast<GLFWwindow*>(window));
    window = nullptr;
    glfwTerminate();
}
