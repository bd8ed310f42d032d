#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "simple_uikit.hpp"

namespace {

struct label : public su::refreshable {
    label(std::string text) : m_text(std::move(text)), m_refreshes(0) { }

    void refresh() {
        ++m_refreshes;
    }

    std::string m_text;
    int m_refreshes;
};

// a widget type with no virtual members at all
struct plain_widget {
    int m_value;
};

typedef std::shared_ptr<label> label_ptr;

label_ptr make_label(const char* text) {
    return std::make_shared<label>(text);
}

}

TEST(simple_uikit, widget_list_first_widget_gets_focus) {
    su::widget_list<label> list;
    EXPECT_EQ(0u, list.size());
    EXPECT_EQ(-1, list.focus_position());
    EXPECT_FALSE(list.focused_widget());
    EXPECT_FALSE(list.widget_at(0));

    auto a = make_label("a");
    list.add_widget(a);
    EXPECT_EQ(0, list.focus_position());
    EXPECT_EQ(a, list.focused_widget());
}

TEST(simple_uikit, widget_list_focus_follows_insertions) {
    su::widget_list<label> list;
    auto a = make_label("a");
    auto b = make_label("b");
    auto c = make_label("c");

    list.add_widget(a);
    list.add_widget(b);
    EXPECT_EQ(a, list.focused_widget());

    EXPECT_TRUE(list.focus_position(1));
    EXPECT_EQ(b, list.focused_widget());

    // inserted before the focused widget
    list.add_widget(c, 0);
    EXPECT_EQ(2, list.focus_position());
    EXPECT_EQ(b, list.focused_widget());

    // indexes past the end append
    auto d = make_label("d");
    list.add_widget(d, 100);
    EXPECT_EQ(d, list.widget_at(3));
    EXPECT_EQ(b, list.focused_widget());
}

TEST(simple_uikit, widget_list_focus_on_removal) {
    su::widget_list<label> list;
    auto a = make_label("a");
    auto b = make_label("b");
    auto c = make_label("c");

    list.add_widget(a);
    list.add_widget(b);
    list.add_widget(c);
    list.focus_position(1);

    // removed before the focused widget
    EXPECT_TRUE(list.remove_widget(a));
    EXPECT_EQ(0, list.focus_position());
    EXPECT_EQ(b, list.focused_widget());

    // removed the focused widget, its successor takes the focus
    EXPECT_TRUE(list.remove_widget(b));
    EXPECT_EQ(c, list.focused_widget());

    EXPECT_FALSE(list.remove_widget(b));
    EXPECT_FALSE(list.remove_widget(label_ptr()));

    EXPECT_TRUE(list.remove_widget(c));
    EXPECT_EQ(-1, list.focus_position());
    EXPECT_FALSE(list.focused_widget());
}

TEST(simple_uikit, widget_list_removing_last_focused_widget) {
    su::widget_list<label> list;
    auto a = make_label("a");
    auto b = make_label("b");

    list.add_widget(a);
    list.add_widget(b);
    list.focus_position(1);

    EXPECT_TRUE(list.remove_widget(b));
    EXPECT_EQ(0, list.focus_position());
    EXPECT_EQ(a, list.focused_widget());
}

TEST(simple_uikit, widget_list_focus_out_of_range) {
    su::widget_list<label> list;
    EXPECT_FALSE(list.focus_position(0));

    list.add_widget(make_label("a"));
    EXPECT_FALSE(list.focus_position(1));
    EXPECT_FALSE(list.focus_position(-1));
    EXPECT_EQ(0, list.focus_position());

    list.clear();
    EXPECT_EQ(0u, list.size());
    EXPECT_EQ(-1, list.focus_position());
}

TEST(simple_uikit, widget_list_refresh) {
    su::widget_list<label> list;
    auto a = make_label("a");
    auto b = make_label("b");
    list.add_widget(a);
    list.add_widget(b);

    list.refresh();
    EXPECT_EQ(1, a->m_refreshes);
    EXPECT_EQ(1, b->m_refreshes);

    su::refresh_widget(a);
    EXPECT_EQ(2, a->m_refreshes);
    su::refresh_widget(label_ptr());

    // widgets which cannot refresh are skipped
    su::widget_list<plain_widget> plain;
    plain.add_widget(std::make_shared<plain_widget>());
    plain.refresh();
    EXPECT_EQ(1u, plain.size());
}
