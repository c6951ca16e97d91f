#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <iostream>
#include <algorithm>

namespace
{
    // one flat-colour pipeline shared by the maze and the panel
    const char* kVertexSrc = R"GLSL(
        #version 330 core
        layout(location = 0) in vec2 aPos;
        layout(location = 1) in vec4 aColor;
        out vec4 vColor;
        void main() {
            vColor = aColor;
            gl_Position = vec4(aPos, 0.0, 1.0);
        }
    )GLSL";

    const char* kFragmentSrc = R"GLSL(
        #version 330 core
        in vec4 vColor;
        out vec4 FragColor;
        void main() {
            FragColor = vColor;
        }
    )GLSL";

    // 0 on failure, the info log goes to stderr
    GLuint CompileStage(GLenum type, const char* src, const char* name)
    {
        const GLuint shader = glCreateShader(type);
        glShaderSource(shader, 1, &src, nullptr);
        glCompileShader(shader);

        GLint ok = GL_FALSE;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
        if (ok == GL_TRUE) return shader;

        char log[1024] = {};
        glGetShaderInfoLog(shader, sizeof(log), nullptr, log);
        std::cerr << name << " shader: " << log << "\n";
        glDeleteShader(shader);
        return 0;
    }

    GLuint BuildProgram()
    {
        const GLuint vs = CompileStage(GL_VERTEX_SHADER, kVertexSrc, "vertex");
        const GLuint fs = CompileStage(GL_FRAGMENT_SHADER, kFragmentSrc, "fragment");
        if (!vs || !fs)
        {
            if (vs) glDeleteShader(vs);
            if (fs) glDeleteShader(fs);
            throw std::runtime_error("Shader compile failed");
        }

        const GLuint prog = glCreateProgram();
        glAttachShader(prog, vs);
        glAttachShader(prog, fs);
        glLinkProgram(prog);
        glDeleteShader(vs);
        glDeleteShader(fs);

        GLint ok = GL_FALSE;
        glGetProgramiv(prog, GL_LINK_STATUS, &ok);
        if (ok != GL_TRUE)
        {
            char log[1024] = {};
            glGetProgramInfoLog(prog, sizeof(log), nullptr, log);
            std::cerr << "program link: " << log << "\n";
            glDeleteProgram(prog);
            throw std::runtime_error("Program link failed");
        }
        return prog;
    }

    // VAO + VBO for the interleaved pos2/color4 layout of Vertex
    void CreateStream(GLuint& vao, GLuint& vbo)
    {
        glGenVertexArrays(1, &vao);
        glGenBuffers(1, &vbo);

        glBindVertexArray(vao);
        glBindBuffer(GL_ARRAY_BUFFER, vbo);

        const auto stride = (GLsizei)sizeof(Vertex);
        glEnableVertexAttribArray(0);
        glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, stride, (const void*)offsetof(Vertex, x));
        glEnableVertexAttribArray(1);
        glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, stride, (const void*)offsetof(Vertex, r));

        glBindVertexArray(0);
        glBindBuffer(GL_ARRAY_BUFFER, 0);
    }

    void DeleteStream(uint32_t& vao, uint32_t& vbo)
    {
        if (vbo) { glDeleteBuffers(1, &vbo); vbo = 0; }
        if (vao) { glDeleteVertexArrays(1, &vao); vao = 0; }
    }
}

void Viewer::initWindowAndGL()
{
    glfwSetErrorCallback([](int code, const char* description) {
        std::cerr << "GLFW error " << code << ": " << description << "\n";
    });

    if (!glfwInit())
        throw std::runtime_error("glfwInit failed");

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    // panel on the left, square maze viewport on the right
    GLFWwindow* win = glfwCreateWindow(900, 600, "Maze Viewer", nullptr, nullptr);
    if (!win)
    {
        glfwTerminate();
        throw std::runtime_error("glfwCreateWindow failed");
    }
    window = win;

    glfwSetWindowAspectRatio(win, 3, 2);
    glfwMakeContextCurrent(win);
    glfwSwapInterval(1);

    glfwSetWindowUserPointer(win, this);
    glfwSetFramebufferSizeCallback(win, [](GLFWwindow* w, int width, int height) {
        // may fire before the loader runs, so no gl* calls here
        if (auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w)))
            self->onFramebufferResized(width, height);
    });

    int w = 1, h = 1;
    glfwGetFramebufferSize(win, &w, &h);
    onFramebufferResized(w, h);

    try
    {
        if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
            throw std::runtime_error("gladLoadGLLoader failed");

        program = BuildProgram();
    }
    catch (const std::runtime_error&)
    {
        shutdownGL();
        throw;
    }

    CreateStream(vao, vbo);
    CreateStream(uiVao, uiVbo);

    glViewport(0, 0, fbW, fbH);

    // explored cells are translucent
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    initUiCallbacks();
    updateWindowTitle();
}

void Viewer::shutdownGL()
{
    if (!window) return;

    if (program) { glDeleteProgram(program); program = 0; }
    DeleteStream(vao, vbo);
    DeleteStream(uiVao, uiVbo);

    glfwDestroyWindow(static_cast<GLFWwindow*>(window));
    window = nullptr;
    glfwTerminate();
}
