#include "visualizer.hpp"
#include "orbit_camera.hpp"
#include "logging.hpp"

#ifdef DRAPE_HAS_VISUALIZATION

#include <GLFW/glfw3.h>
#include <algorithm>
#include <chrono>
#include <cmath>

namespace drape {

namespace {

// Viewer state shared with the GLFW callbacks
struct ViewerState {
    Cloth* cloth = nullptr;
    const VisualizerConfig* config = nullptr;
    OrbitCamera camera;
    DragState drag;

    bool mouse_down = false;
    bool have_last_cursor = false;
    double last_x = 0.0;
    double last_y = 0.0;
    bool paused = false;
};

ViewerState g_state;

void mouse_button_callback(GLFWwindow* window, int button, int action, int mods) {
    if (button != GLFW_MOUSE_BUTTON_LEFT) {
        return;
    }

    if (action == GLFW_RELEASE) {
        g_state.mouse_down = false;
        if (g_state.drag.active()) {
            auto log = drape::logging::get_logger();
            log->debug("Viewer: released particle ({}, {})",
                       g_state.drag.target->x, g_state.drag.target->y);
        }
        g_state.drag.release();
        return;
    }

    g_state.mouse_down = true;
    if (!(mods & GLFW_MOD_SHIFT)) {
        return;
    }

    double px = 0.0;
    double py = 0.0;
    int width = 0;
    int height = 0;
    glfwGetCursorPos(window, &px, &py);
    glfwGetWindowSize(window, &width, &height);

    Ray ray = g_state.camera.pixel_ray(px, py, width, height);
    if (g_state.drag.begin(g_state.cloth->grid(), ray)) {
        auto log = drape::logging::get_logger();
        log->info("Viewer: grabbed particle ({}, {})",
                  g_state.drag.target->x, g_state.drag.target->y);
    }
}

void cursor_position_callback(GLFWwindow* window, double xpos, double ypos) {
    (void)window;
    if (!g_state.have_last_cursor) {
        g_state.last_x = xpos;
        g_state.last_y = ypos;
        g_state.have_last_cursor = true;
    }

    float dx = static_cast<float>(xpos - g_state.last_x);
    float dy = static_cast<float>(ypos - g_state.last_y);
    g_state.last_x = xpos;
    g_state.last_y = ypos;

    if (!g_state.mouse_down) {
        return;
    }

    if (g_state.drag.active()) {
        const float scale = g_state.config->drag_force_scale;
        const GridCoord& at = *g_state.drag.target;
        g_state.cloth->drag(at.x, at.y, dx * scale, -dy * scale);
    } else {
        const float speed = g_state.config->rotation_speed * 0.01f;
        g_state.camera.rotate(dx * speed, dy * speed);
    }
}

void scroll_callback(GLFWwindow* window, double xoffset, double yoffset) {
    (void)window;
    (void)xoffset;
    const float zoom = g_state.config->zoom_speed;
    if (yoffset > 0) {
        g_state.camera.zoom(1.0f / zoom);
    } else if (yoffset < 0) {
        g_state.camera.zoom(zoom);
    }
}

void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    if (action != GLFW_PRESS) {
        return;
    }

    auto log = drape::logging::get_logger();
    if (key == GLFW_KEY_ESCAPE || key == GLFW_KEY_Q) {
        glfwSetWindowShouldClose(window, GLFW_TRUE);
    } else if (key == GLFW_KEY_SPACE) {
        g_state.paused = !g_state.paused;
        log->info("Viewer: {}", g_state.paused ? "paused" : "running");
    } else if (key == GLFW_KEY_W) {
        bool enabled = !g_state.cloth->config().enable_wind;
        g_state.cloth->set_wind_enabled(enabled);
        log->info("Viewer: wind {}", enabled ? "on" : "off");
    } else if (key == GLFW_KEY_G) {
        bool enabled = !g_state.cloth->config().enable_gravity;
        g_state.cloth->set_gravity_enabled(enabled);
        log->info("Viewer: gravity {}", enabled ? "on" : "off");
    }
}

void setup_lighting() {
    glEnable(GL_LIGHTING);
    glEnable(GL_LIGHT0);
    glEnable(GL_COLOR_MATERIAL);
    glEnable(GL_NORMALIZE);
    glLightModeli(GL_LIGHT_MODEL_TWO_SIDE, GL_TRUE);
    glColorMaterial(GL_FRONT_AND_BACK, GL_AMBIENT_AND_DIFFUSE);

    GLfloat light_pos[] = {0.4f, 0.6f, 1.0f, 0.0f};
    GLfloat light_ambient[] = {0.25f, 0.25f, 0.25f, 1.0f};
    GLfloat light_diffuse[] = {0.8f, 0.8f, 0.8f, 1.0f};

    glLightfv(GL_LIGHT0, GL_POSITION, light_pos);
    glLightfv(GL_LIGHT0, GL_AMBIENT, light_ambient);
    glLightfv(GL_LIGHT0, GL_DIFFUSE, light_diffuse);
}

void apply_camera(const OrbitCamera& camera) {
    const float to_deg = 180.0f / 3.14159265f;
    glTranslatef(0.0f, 0.0f, -camera.distance);
    glRotatef(camera.pitch * to_deg, 1.0f, 0.0f, 0.0f);
    glRotatef(camera.yaw * to_deg, 0.0f, 1.0f, 0.0f);
    glTranslatef(-camera.target.x, -camera.target.y, -camera.target.z);
}

// Draws the published triangle list with a checker colour from the
// texture coordinates
void render_cloth(const Cloth& cloth, int checker_tiles) {
    const auto& triangles = cloth.triangles();
    const auto& normals = cloth.normals();
    const auto& tex_coords = cloth.tex_coords();

    glBegin(GL_TRIANGLES);
    for (size_t i = 0; i < triangles.size(); ++i) {
        const Vec2& uv = tex_coords[i];
        int cell = static_cast<int>(std::floor(uv.x * checker_tiles)) +
                   static_cast<int>(std::floor(uv.y * checker_tiles));
        if (cell % 2 == 0) {
            glColor3f(0.92f, 0.90f, 0.85f);
        } else {
            glColor3f(0.35f, 0.55f, 0.85f);
        }
        glNormal3f(normals[i].x, normals[i].y, normals[i].z);
        glVertex3f(triangles[i].x, triangles[i].y, triangles[i].z);
    }
    glEnd();
}

void render_pins(const Cloth& cloth) {
    glDisable(GL_LIGHTING);
    glPointSize(8.0f);
    glBegin(GL_POINTS);
    for (const auto& p : cloth.grid().particles()) {
        if (p.movable) {
            continue;
        }
        glColor3f(0.9f, 0.2f, 0.2f);
        glVertex3f(p.position.x, p.position.y, p.position.z);
    }
    if (g_state.drag.active()) {
        const auto& p = cloth.grid().particle(g_state.drag.target->x, g_state.drag.target->y);
        glColor3f(1.0f, 0.85f, 0.1f);
        glVertex3f(p.position.x, p.position.y, p.position.z);
    }
    glEnd();
    glEnable(GL_LIGHTING);
}

}  // namespace

VisualizerResult run_viewer(Cloth& cloth, const VisualizerConfig& config) {
    auto log = drape::logging::get_logger();
    VisualizerResult result;

    if (!glfwInit()) {
        log->error("Failed to initialize GLFW");
        return result;
    }

    glfwWindowHint(GLFW_VISIBLE, GLFW_TRUE);
    glfwWindowHint(GLFW_FOCUSED, GLFW_TRUE);
    glfwWindowHint(GLFW_SAMPLES, 4);

    GLFWwindow* window = glfwCreateWindow(
        config.window_width,
        config.window_height,
        config.window_title.c_str(),
        nullptr, nullptr);

    if (!window) {
        log->error("Failed to create GLFW window");
        glfwTerminate();
        return result;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    glfwSetMouseButtonCallback(window, mouse_button_callback);
    glfwSetCursorPosCallback(window, cursor_position_callback);
    glfwSetScrollCallback(window, scroll_callback);
    glfwSetKeyCallback(window, key_callback);

    g_state = ViewerState{};
    g_state.cloth = &cloth;
    g_state.config = &config;
    g_state.paused = !config.auto_run;
    g_state.camera.distance = config.camera_distance;
    g_state.camera.pitch = 0.2f;
    g_state.camera.target = Vec3(cloth.geometry().width * 0.5f,
                                 -cloth.geometry().height * 0.5f,
                                 0.0f);

    glEnable(GL_DEPTH_TEST);
    glShadeModel(GL_SMOOTH);
    setup_lighting();
    glClearColor(0.1f, 0.1f, 0.15f, 1.0f);

    log->info("Viewer started. Controls:");
    log->info("  mouse drag=rotate, scroll=zoom");
    log->info("  shift+drag=pull the cloth");
    log->info("  space=pause/resume, w=toggle wind, g=toggle gravity, q=quit");

    double last_time = glfwGetTime();

    while (!glfwWindowShouldClose(window)) {
        double now = glfwGetTime();
        double frame_time = std::min(now - last_time, config.max_frame_time);
        last_time = now;

        if (!g_state.paused) {
            result.ticks += static_cast<uint64_t>(
                cloth.update(std::chrono::duration<double>(frame_time)));
        }

        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(window, &width, &height);
        glViewport(0, 0, width, height);

        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        float aspect = height > 0 ? static_cast<float>(width) / static_cast<float>(height) : 1.0f;
        float near = 0.1f;
        float far = 1000.0f;
        float top = near * std::tan(g_state.camera.fov_y / 2.0f);
        float right = top * aspect;
        glFrustum(-right, right, -top, top, near, far);

        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();
        apply_camera(g_state.camera);

        // Directional light fixed in camera space
        glPushMatrix();
        glLoadIdentity();
        GLfloat light_pos[] = {0.4f, 0.6f, 1.0f, 0.0f};
        glLightfv(GL_LIGHT0, GL_POSITION, light_pos);
        glPopMatrix();

        glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
        render_cloth(cloth, config.checker_tiles);
        render_pins(cloth);

        glfwSwapBuffers(window);
        glfwPollEvents();
        ++result.frames;
    }

    result.completed = true;
    g_state = ViewerState{};

    glfwDestroyWindow(window);
    glfwTerminate();

    log->info("Viewer ended after {} frames.", result.frames);
    return result;
}

bool visualization_available() {
    return true;
}

}  // namespace drape

#else  // DRAPE_HAS_VISUALIZATION not defined

namespace drape {

VisualizerResult run_viewer(Cloth&, const VisualizerConfig&) {
    auto log = drape::logging::get_logger();
    log->error("Visualization not available - compile with GLFW and OpenGL");
    return VisualizerResult{};
}

bool visualization_available() {
    return false;
}

}  // namespace drape

#endif  // DRAPE_HAS_VISUALIZATION
