
#include <JuceHeader.h>

#include "ScriptNode.h"

ScriptNode::ScriptNode()
{
}

ScriptNode::~ScriptNode()
{
}

juce::var ScriptNode::getValue(const juce::String& param) const
{
    const juce::var* v = values.getVarPointer(juce::Identifier(param));
    return (v != nullptr) ? *v : juce::var();
}

void ScriptNode::setValue(const juce::String& param, juce::var value)
{
    values.set(juce::Identifier(param), value);
}

ScriptNode* ScriptNode::add(ScriptNode* child)
{
    children.add(child);
    return child;
}

/**
 * Editor format:
 *
 *    {"name": "copy-file", "disable": false,
 *     "values": {"from": "a.txt", "to": "b.txt"},
 *     "children": [ ... ]}
 */
bool ScriptNode::parse(juce::var json, juce::String& error)
{
    juce::DynamicObject* obj = json.getDynamicObject();
    if (obj == nullptr) {
        error = "Script node is not an object";
        return false;
    }

    name = obj->getProperty("name").toString();
    if (name.isEmpty()) {
        error = "Script node has no name";
        return false;
    }

    disabled = (bool)obj->getProperty("disable");

    juce::var jvalues = obj->getProperty("values");
    juce::DynamicObject* vobj = jvalues.getDynamicObject();
    if (vobj != nullptr) {
        for (auto& prop : vobj->getProperties())
          values.set(prop.name, prop.value);
    }

    return parseList(obj->getProperty("children"), children, error);
}

bool ScriptNode::parseList(juce::var json, juce::OwnedArray<ScriptNode>& list,
                           juce::String& error)
{
    // missing is the same as empty
    if (json.isVoid())
      return true;

    juce::Array<juce::var>* array = json.getArray();
    if (array == nullptr) {
        error = "Script node list is not an array";
        return false;
    }

    for (auto& item : *array) {
        std::unique_ptr<ScriptNode> node (new ScriptNode());
        if (!node->parse(item, error))
          return false;
        list.add(node.release());
    }
    return true;
}
