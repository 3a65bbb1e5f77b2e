#include <gtk/gtk.h>

#include "quadrant/config.h"
#include "quadrant/display.h"
#include "quadrant/klog.h"
#include "quadrant/scheduler.h"

using namespace quadrant;

static const int CELL_W = 10;
static const int CELL_H = 18;

// VGA text palette as cairo RGB
static const double VGA_RGB[16][3] = {
    {0.00, 0.00, 0.00}, {0.00, 0.00, 0.67}, {0.00, 0.67, 0.00}, {0.00, 0.67, 0.67},
    {0.67, 0.00, 0.00}, {0.67, 0.00, 0.67}, {0.67, 0.33, 0.00}, {0.67, 0.67, 0.67},
    {0.33, 0.33, 0.33}, {0.33, 0.33, 1.00}, {0.33, 1.00, 0.33}, {0.33, 1.00, 1.00},
    {1.00, 0.33, 0.33}, {1.00, 0.33, 1.00}, {1.00, 1.00, 0.33}, {1.00, 1.00, 1.00},
};

struct SimState {
    Scheduler* scheduler;
    TextGrid   grid;
    GtkWidget* canvas;
};


static void glib_log_sink(LogLevel level, const char* line) {
    GLogLevelFlags flags = G_LOG_LEVEL_INFO;
    switch (level) {
        case LOG_DEBUG: flags = G_LOG_LEVEL_DEBUG; break;
        case LOG_INFO:  flags = G_LOG_LEVEL_INFO; break;
        case LOG_WARN:  flags = G_LOG_LEVEL_WARNING; break;
        case LOG_ERROR: flags = G_LOG_LEVEL_CRITICAL; break;
    }
    g_log("quadrant", flags, "%s", line);
}

static void sim_panic(const char* message) {
    g_error("%s", message);
}

static bool translate_key(const GdkEventKey* event, KeyEvent& out) {
    switch (event->keyval) {
        case GDK_KEY_F1: out = KeyEvent::raw(KEY_F1); return true;
        case GDK_KEY_F2: out = KeyEvent::raw(KEY_F2); return true;
        case GDK_KEY_F3: out = KeyEvent::raw(KEY_F3); return true;
        case GDK_KEY_F4: out = KeyEvent::raw(KEY_F4); return true;
        case GDK_KEY_F5: out = KeyEvent::raw(KEY_F5); return true;
        case GDK_KEY_F6: out = KeyEvent::raw(KEY_F6); return true;
        case GDK_KEY_Up:     out = KeyEvent::raw(KEY_ARROW_UP); return true;
        case GDK_KEY_Down:   out = KeyEvent::raw(KEY_ARROW_DOWN); return true;
        case GDK_KEY_Left:   out = KeyEvent::raw(KEY_ARROW_LEFT); return true;
        case GDK_KEY_Right:  out = KeyEvent::raw(KEY_ARROW_RIGHT); return true;
        case GDK_KEY_Escape: out = KeyEvent::raw(KEY_ESCAPE); return true;
        case GDK_KEY_Return:
        case GDK_KEY_KP_Enter:
            out = KeyEvent::character('\n');
            return true;
        case GDK_KEY_BackSpace:
            out = KeyEvent::character('\b');
            return true;
        default:
            break;
    }
    guint32 ch = gdk_keyval_to_unicode(event->keyval);
    if (ch >= 32 && ch < 127) {
        out = KeyEvent::character((char)ch);
        return true;
    }
    return false;
}

static gboolean on_key_press(GtkWidget*, GdkEventKey* event, gpointer data) {
    SimState* sim = (SimState*)data;
    KeyEvent key;
    if (!translate_key(event, key)) return FALSE;
    sim->scheduler->key(key);
    return TRUE;
}

static gboolean on_draw(GtkWidget*, cairo_t* cr, gpointer data) {
    SimState* sim = (SimState*)data;
    cairo_select_font_face(cr, "monospace", CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
    cairo_set_font_size(cr, 15);

    for (int row = 0; row < config::SCREEN_HEIGHT; row++) {
        for (int col = 0; col < config::SCREEN_WIDTH; col++) {
            ColorCode color = sim->grid.color_at(col, row);
            const double* bg = VGA_RGB[color.background()];
            const double* fg = VGA_RGB[color.foreground()];

            cairo_set_source_rgb(cr, bg[0], bg[1], bg[2]);
            cairo_rectangle(cr, col * CELL_W, row * CELL_H, CELL_W, CELL_H);
            cairo_fill(cr);

            char text[2] = { sim->grid.char_at(col, row), '\0' };
            if (text[0] == ' ') continue;
            cairo_set_source_rgb(cr, fg[0], fg[1], fg[2]);
            cairo_move_to(cr, col * CELL_W + 1, row * CELL_H + CELL_H - 4);
            cairo_show_text(cr, text);
        }
    }
    return FALSE;
}

static gboolean on_tick(gpointer data) {
    SimState* sim = (SimState*)data;
    sim->scheduler->update(sim->grid);
    gtk_widget_queue_draw(sim->canvas);
    return G_SOURCE_CONTINUE;
}

static void activate(GtkApplication* app, gpointer data) {
    SimState* sim = (SimState*)data;

    GtkWidget* window = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(window), "Quadrant");
    gtk_window_set_resizable(GTK_WINDOW(window), FALSE);

    sim->canvas = gtk_drawing_area_new();
    gtk_widget_set_size_request(sim->canvas, config::SCREEN_WIDTH * CELL_W, config::SCREEN_HEIGHT * CELL_H);
    gtk_container_add(GTK_CONTAINER(window), sim->canvas);

    g_signal_connect(sim->canvas, "draw", G_CALLBACK(on_draw), sim);
    g_signal_connect(window, "key-press-event", G_CALLBACK(on_key_press), sim);
    g_timeout_add(1000 / QUADRANT_TIMER_HZ, on_tick, sim);

    gtk_widget_show_all(window);
}

int main(int argc, char** argv) {
    klog_set_sink(glib_log_sink);
    kpanic_set_handler(sim_panic);

    SimState* sim = new SimState();
    sim->scheduler = new Scheduler();
    sim->scheduler->init();
    sim->canvas = nullptr;

    GtkApplication* app = gtk_application_new("org.quadrant.sim", G_APPLICATION_DEFAULT_FLAGS);
    g_signal_connect(app, "activate", G_CALLBACK(activate), sim);
    int status = g_application_run(G_APPLICATION(app), argc, argv);
    g_object_unref(app);

    delete sim->scheduler;
    delete sim;
    return status;
}
