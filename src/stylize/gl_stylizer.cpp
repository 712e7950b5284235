#define GL_GLEXT_PROTOTYPES
#define GLFW_INCLUDE_GLEXT
#include <GLFW/glfw3.h>

#include "stylize/gl_stylizer.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace toon {

// Plane positions in clip space plus texture coordinates, drawn as a triangle strip
static const GLfloat kQuad[] = {
    -1.f, -1.f, 0.f, 0.f,
     1.f, -1.f, 1.f, 0.f,
    -1.f,  1.f, 0.f, 1.f,
     1.f,  1.f, 1.f, 1.f,
};

static const char* kVertexShader = R"(#version 330 core
layout(location = 0) in vec2 a_position;
layout(location = 1) in vec2 a_uv;
uniform vec2 u_plane_scale;
out vec2 v_uv;
void main() {
  v_uv = a_uv;
  gl_Position = vec4(a_position * u_plane_scale, 0.0, 1.0);
}
)";

static const char* kFragmentShader = R"(#version 330 core
in vec2 v_uv;
out vec4 frag_color;
uniform sampler2D u_frame;
uniform vec2 u_resolution;
uniform float u_levels;
uniform float u_edge_threshold;

float Luminance(vec3 color) {
  return dot(color, vec3(0.299, 0.587, 0.114));
}

float LumAt(vec2 offset) {
  vec2 texel = 1.0 / u_resolution;
  return Luminance(texture(u_frame, v_uv + texel * offset).rgb);
}

void main() {
  float tl = LumAt(vec2(-1.0,  1.0));
  float t  = LumAt(vec2( 0.0,  1.0));
  float tr = LumAt(vec2( 1.0,  1.0));
  float l  = LumAt(vec2(-1.0,  0.0));
  float r  = LumAt(vec2( 1.0,  0.0));
  float bl = LumAt(vec2(-1.0, -1.0));
  float b  = LumAt(vec2( 0.0, -1.0));
  float br = LumAt(vec2( 1.0, -1.0));

  float gx = -tl - 2.0 * l - bl + tr + 2.0 * r + br;
  float gy = -tl - 2.0 * t - tr + bl + 2.0 * b + br;
  float magnitude = sqrt(gx * gx + gy * gy);

  vec3 color = texture(u_frame, v_uv).rgb;
  vec3 posterized = floor(color * u_levels) / u_levels;

  vec3 final_color = (magnitude > u_edge_threshold) ? vec3(0.0) : posterized;
  frag_color = vec4(final_color, 1.0);
}
)";

static std::string ShaderLog(GLuint shader) {
  GLint len = 0;
  glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
  if (len <= 1) return "";
  std::vector<char> log(static_cast<std::size_t>(len));
  glGetShaderInfoLog(shader, len, nullptr, log.data());
  return std::string(log.data());
}

static std::string ProgramLog(GLuint program) {
  GLint len = 0;
  glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
  if (len <= 1) return "";
  std::vector<char> log(static_cast<std::size_t>(len));
  glGetProgramInfoLog(program, len, nullptr, log.data());
  return std::string(log.data());
}

// Returns 0 and fills err on failure
static GLuint CompileShader(GLenum type, const char* src, std::string& err) {
  GLuint shader = glCreateShader(type);
  glShaderSource(shader, 1, &src, nullptr);
  glCompileShader(shader);

  GLint ok = GL_FALSE;
  glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
  if (ok != GL_TRUE) {
    err = ShaderLog(shader);
    glDeleteShader(shader);
    return 0;
  }
  return shader;
}

GlStylizer::GlStylizer(GpuStyleConfig cfg) : cfg_(std::move(cfg)) {
  if (!init_context()) return;
  if (!build_program()) return;
  create_quad();

  ready_ = true;
  status_ = "ok";
  std::cout << "gpu_stylizer ready (" << glGetString(GL_VERSION) << ")" << std::endl;
}

GlStylizer::~GlStylizer() {
  release();
}

void GlStylizer::fail(const std::string& msg) {
  ready_ = false;
  status_ = msg;
  std::cerr << "gpu_stylizer: " << msg << "\n";
}

bool GlStylizer::init_context() {
  if (glfwInit() != GLFW_TRUE) {
    fail("graphics unavailable: failed to initialize GLFW");
    return false;
  }

  glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);

  window_ = glfwCreateWindow(1, 1, "toonycam-gpu", nullptr, nullptr);
  if (window_ == nullptr) {
    glfwTerminate();
    fail("graphics unavailable: no OpenGL 3.3 context");
    return false;
  }
  glfwMakeContextCurrent(window_);
  return true;
}

bool GlStylizer::build_program() {
  std::string err;
  const GLuint vs = CompileShader(GL_VERTEX_SHADER, kVertexShader, err);
  if (vs == 0) {
    fail("vertex shader compile failed: " + err);
    return false;
  }
  const GLuint fs = CompileShader(GL_FRAGMENT_SHADER, kFragmentShader, err);
  if (fs == 0) {
    glDeleteShader(vs);
    fail("fragment shader compile failed: " + err);
    return false;
  }

  program_ = glCreateProgram();
  glAttachShader(program_, vs);
  glAttachShader(program_, fs);
  glLinkProgram(program_);

  // Shaders are owned by the program once linked
  glDetachShader(program_, vs);
  glDetachShader(program_, fs);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint ok = GL_FALSE;
  glGetProgramiv(program_, GL_LINK_STATUS, &ok);
  if (ok != GL_TRUE) {
    fail("shader link failed: " + ProgramLog(program_));
    return false;
  }

  loc_frame_ = glGetUniformLocation(program_, "u_frame");
  loc_resolution_ = glGetUniformLocation(program_, "u_resolution");
  loc_levels_ = glGetUniformLocation(program_, "u_levels");
  loc_threshold_ = glGetUniformLocation(program_, "u_edge_threshold");
  loc_plane_scale_ = glGetUniformLocation(program_, "u_plane_scale");
  return true;
}

void GlStylizer::create_quad() {
  glGenVertexArrays(1, &vao_);
  glBindVertexArray(vao_);

  glGenBuffers(1, &vbo_);
  glBindBuffer(GL_ARRAY_BUFFER, vbo_);
  glBufferData(GL_ARRAY_BUFFER, sizeof(kQuad), kQuad, GL_STATIC_DRAW);

  glEnableVertexAttribArray(0);
  glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(GLfloat), nullptr);
  glEnableVertexAttribArray(1);
  glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(GLfloat),
                        reinterpret_cast<const void*>(2 * sizeof(GLfloat)));

  glBindVertexArray(0);
}

void GlStylizer::ensure_texture(cv::Size frame) {
  if (texture_ != 0 && frame == texture_size_) return;

  if (texture_ == 0) glGenTextures(1, &texture_);
  glBindTexture(GL_TEXTURE_2D, texture_);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  // Neighbors sampled past the frame edge clamp to the border texel
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, frame.width, frame.height, 0, GL_BGRA, GL_UNSIGNED_BYTE, nullptr);
  texture_size_ = frame;
}

void GlStylizer::ensure_target(cv::Size target) {
  if (fbo_ != 0 && target == target_size_) return;

  if (fbo_ == 0) glGenFramebuffers(1, &fbo_);
  if (color_rb_ == 0) glGenRenderbuffers(1, &color_rb_);

  glBindRenderbuffer(GL_RENDERBUFFER, color_rb_);
  glRenderbufferStorage(GL_RENDERBUFFER, GL_RGBA8, target.width, target.height);

  glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
  glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_RENDERBUFFER, color_rb_);
  target_size_ = target;
}

cv::Mat GlStylizer::stylize(const cv::Mat& frame) {
  if (!ready_ || frame.empty()) return frame;

  cv::Mat src = frame;
  if (src.type() == CV_8UC3) cv::cvtColor(frame, src, cv::COLOR_BGR2BGRA);
  if (src.type() != CV_8UC4) {
    std::cerr << "gpu_stylizer: unsupported frame type " << src.type() << ", presenting raw frame\n";
    return frame;
  }
  if (!src.isContinuous()) src = src.clone();

  glfwMakeContextCurrent(window_);

  const cv::Size target = (cfg_.output_width > 0 && cfg_.output_height > 0)
                              ? cv::Size(cfg_.output_width, cfg_.output_height)
                              : src.size();

  // Both sizes can change between ticks, so the letterbox is refreshed every pass
  ensure_texture(src.size());
  ensure_target(target);
  plane_scale_ = ComputeLetterbox(src.size(), target);

  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glBindTexture(GL_TEXTURE_2D, texture_);
  glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, src.cols, src.rows, GL_BGRA, GL_UNSIGNED_BYTE, src.data);

  glBindFramebuffer(GL_FRAMEBUFFER, fbo_);
  if (glCheckFramebufferStatus(GL_FRAMEBUFFER) != GL_FRAMEBUFFER_COMPLETE) {
    std::cerr << "gpu_stylizer: render target incomplete, presenting raw frame\n";
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    return frame;
  }

  glViewport(0, 0, target.width, target.height);
  glClearColor(0.f, 0.f, 0.f, 1.f);
  glClear(GL_COLOR_BUFFER_BIT);

  glUseProgram(program_);
  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, texture_);
  glUniform1i(loc_frame_, 0);
  glUniform2f(loc_resolution_, static_cast<GLfloat>(src.cols), static_cast<GLfloat>(src.rows));
  glUniform1f(loc_levels_, static_cast<GLfloat>(cfg_.levels));
  glUniform1f(loc_threshold_, cfg_.edge_threshold);
  glUniform2f(loc_plane_scale_, plane_scale_.x, plane_scale_.y);

  glBindVertexArray(vao_);
  glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
  glBindVertexArray(0);

  // Row 0 of the upload is v = 0, which is also row 0 of the readback, so no flip is needed
  cv::Mat out(target, CV_8UC4);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, target.width, target.height, GL_BGRA, GL_UNSIGNED_BYTE, out.data);
  glBindFramebuffer(GL_FRAMEBUFFER, 0);

  const GLenum err = glGetError();
  if (err != GL_NO_ERROR) {
    std::cerr << "gpu_stylizer: GL error 0x" << std::hex << err << std::dec << ", presenting raw frame\n";
    return frame;
  }
  return out;
}

void GlStylizer::release() {
  if (window_ == nullptr) return;
  glfwMakeContextCurrent(window_);

  if (color_rb_ != 0) glDeleteRenderbuffers(1, &color_rb_);
  if (fbo_ != 0) glDeleteFramebuffers(1, &fbo_);
  if (texture_ != 0) glDeleteTextures(1, &texture_);
  if (vbo_ != 0) glDeleteBuffers(1, &vbo_);
  if (vao_ != 0) glDeleteVertexArrays(1, &vao_);
  if (program_ != 0) glDeleteProgram(program_);
  color_rb_ = fbo_ = texture_ = vbo_ = vao_ = program_ = 0;

  glfwMakeContextCurrent(nullptr);
  glfwDestroyWindow(window_);
  window_ = nullptr;
  glfwTerminate();
  ready_ = false;
  status_ = "released";
}

} // namespace toon
